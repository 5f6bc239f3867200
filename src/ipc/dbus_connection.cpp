/*
 * winpipe D-Bus Connection Implementation
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 * Description: See header for details.
 */
#include <winpipe/ipc/dbus_connection.hpp>
#include <winpipe/util/error.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <cstdlib>
#include <mutex>

namespace winpipe::ipc {

namespace {

// The listener polls one connection while the main thread calls on another.
void init_threads() {
    static std::once_flag once;
    std::call_once(once, [] {
        if (!dbus_threads_init_default()) throw IpcError("cannot initialise libdbus threading");
    });
}

int remaining_ms(std::chrono::steady_clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

} // namespace

std::unique_ptr<BusConnection> BusConnection::open_session_bus(int reply_timeout_ms) {
    const char* env = std::getenv("DBUS_SESSION_BUS_ADDRESS");
    if (env && *env) return open_bus(env, reply_timeout_ms);
    const char* runtime = std::getenv("XDG_RUNTIME_DIR");
    if (!runtime) throw IpcError("DBUS_SESSION_BUS_ADDRESS and XDG_RUNTIME_DIR are both unset");
    return open_bus(std::string("unix:path=") + runtime + "/bus", reply_timeout_ms);
}

std::unique_ptr<BusConnection> BusConnection::open_bus(const std::string& address, int reply_timeout_ms) {
    init_threads();
    BusError err;
    DBusConnection* conn = dbus_connection_open_private(address.c_str(), err.get());
    if (!conn) throw IpcError("cannot connect to bus at '" + address + "': " + err.text());
    dbus_connection_set_exit_on_disconnect(conn, FALSE);
    if (!dbus_bus_register(conn, err.get())) {
        dbus_connection_close(conn);
        dbus_connection_unref(conn);
        IpcError e("Hello failed: " + err.text());
        e.add_context("failed to set up bus connection to '" + address + "'");
        throw e;
    }
    auto out = std::make_unique<BusConnection>(conn, reply_timeout_ms);
    spdlog::debug("connected to {} as {}", address, out->unique_name());
    return out;
}

BusConnection::BusConnection(DBusConnection* conn, int reply_timeout_ms) : m_conn(conn), m_timeout_ms(reply_timeout_ms) {
    const char* name = dbus_bus_get_unique_name(m_conn);
    if (name) m_unique_name = name;
}

BusConnection::~BusConnection() {
    dbus_connection_close(m_conn);
    dbus_connection_unref(m_conn);
}

MessagePtr BusConnection::call(const std::string& destination, const std::string& path,
                               const std::string& interface, const std::string& member,
                               const std::vector<std::string>& args) {
    MessagePtr msg = new_method_call(destination, path, interface, member, args);
    spdlog::debug("-> {} {} {}.{}", destination, path, interface, member);

    BusError err;
    MessagePtr reply(dbus_connection_send_with_reply_and_block(m_conn, msg.get(), m_timeout_ms, err.get()));
    if (!reply) {
        if (err.has_name(DBUS_ERROR_NO_REPLY) || err.has_name(DBUS_ERROR_TIMEOUT)) {
            throw IpcError("timed out waiting for reply to " + member);
        }
        throw IpcError(err.text());
    }
    return reply;
}

void BusConnection::acknowledge(DBusMessage* call) {
    if (dbus_message_get_no_reply(call)) return;
    MessagePtr reply(dbus_message_new_method_return(call));
    if (!reply || !dbus_connection_send(m_conn, reply.get(), nullptr)) {
        throw IpcError("out of memory acknowledging " + std::string(dbus_message_get_member(call)));
    }
    dbus_connection_flush(m_conn);
}

bool BusConnection::poll_call(int timeout_ms, IncomingCall& out) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    for (;;) {
        MessagePtr in(dbus_connection_pop_message(m_conn));
        if (!in) {
            int left = remaining_ms(deadline);
            if (left == 0) return false;
            if (!dbus_connection_read_write(m_conn, left)) throw IpcError("bus closed the connection");
            continue;
        }
        if (dbus_message_get_type(in.get()) != DBUS_MESSAGE_TYPE_METHOD_CALL) {
            const char* member = dbus_message_get_member(in.get());
            spdlog::debug("ignoring bus message '{}' of type {}", member ? member : "", dbus_message_get_type(in.get()));
            continue;
        }
        acknowledge(in.get());
        const char* sender = dbus_message_get_sender(in.get());
        out.member = dbus_message_get_member(in.get());
        out.payload = first_string_arg(in.get());
        out.sender = sender ? sender : "";
        return true;
    }
}

} // namespace winpipe::ipc
