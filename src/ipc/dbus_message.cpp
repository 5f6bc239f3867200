/*
 * winpipe D-Bus Message Helpers Implementation
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 * Description: See header for details.
 */
#include <winpipe/ipc/dbus_message.hpp>
#include <winpipe/util/error.hpp>

namespace winpipe::ipc {

namespace {

std::string signature_of(DBusMessage* msg) {
    const char* s = dbus_message_get_signature(msg);
    return s ? s : "";
}

} // namespace

std::string BusError::text() const {
    std::string out = m_err.name ? m_err.name : "org.freedesktop.DBus.Error.Failed";
    if (m_err.message && *m_err.message) out += std::string(": ") + m_err.message;
    return out;
}

MessagePtr new_method_call(const std::string& destination, const std::string& path,
                           const std::string& interface, const std::string& member,
                           const std::vector<std::string>& args) {
    MessagePtr msg(dbus_message_new_method_call(destination.c_str(), path.c_str(), interface.c_str(), member.c_str()));
    if (!msg) throw IpcError("out of memory building call to " + member);

    DBusMessageIter it;
    dbus_message_iter_init_append(msg.get(), &it);
    for (auto& a : args) {
        const char* value = a.c_str();
        if (!dbus_message_iter_append_basic(&it, DBUS_TYPE_STRING, &value)) {
            throw IpcError("out of memory appending argument to " + member);
        }
    }
    return msg;
}

std::int32_t reply_int32(DBusMessage* reply) {
    BusError err;
    dbus_int32_t value = 0;
    if (!dbus_message_get_args(reply, err.get(), DBUS_TYPE_INT32, &value, DBUS_TYPE_INVALID)) {
        throw IpcError("unexpected reply signature '" + signature_of(reply) + "', expected 'i'");
    }
    return value;
}

std::string reply_string(DBusMessage* reply) {
    BusError err;
    const char* value = nullptr;
    if (!dbus_message_get_args(reply, err.get(), DBUS_TYPE_STRING, &value, DBUS_TYPE_INVALID)) {
        throw IpcError("unexpected reply signature '" + signature_of(reply) + "', expected 's'");
    }
    return value;
}

std::optional<std::string> first_string_arg(DBusMessage* msg) {
    DBusMessageIter it;
    if (!dbus_message_iter_init(msg, &it)) return std::nullopt;
    if (dbus_message_iter_get_arg_type(&it) != DBUS_TYPE_STRING) return std::nullopt;
    const char* value = nullptr;
    dbus_message_iter_get_basic(&it, &value);
    return std::string(value ? value : "");
}

} // namespace winpipe::ipc
