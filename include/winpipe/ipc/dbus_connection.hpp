/*
 * winpipe D-Bus Connection
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <memory>
#include <string>
#include <vector>
#include "winpipe/ipc/dbus_message.hpp"
#include "winpipe/ipc/listener.hpp"

namespace winpipe::ipc {

// One private libdbus connection registered on a message bus. Not
// thread-safe: each connection is driven by a single thread.
class BusConnection : public CallbackChannel {
public:
    // DBUS_SESSION_BUS_ADDRESS, or unix:path=$XDG_RUNTIME_DIR/bus when unset.
    static std::unique_ptr<BusConnection> open_session_bus(int reply_timeout_ms);
    // Connects to the bus at address and registers with Hello. Every blocking
    // call waits at most reply_timeout_ms.
    static std::unique_ptr<BusConnection> open_bus(const std::string& address, int reply_timeout_ms);

    // Takes over a registered private connection.
    BusConnection(DBusConnection* conn, int reply_timeout_ms);
    ~BusConnection() override;
    BusConnection(const BusConnection&) = delete;
    BusConnection& operator=(const BusConnection&) = delete;

    // Sends a method call with string arguments and blocks for its reply.
    // Method calls arriving meanwhile stay queued for poll_call. Error
    // replies and timeouts throw IpcError.
    MessagePtr call(const std::string& destination, const std::string& path,
                    const std::string& interface, const std::string& member,
                    const std::vector<std::string>& args = {});

    const std::string& unique_name() const override { return m_unique_name; }
    bool poll_call(int timeout_ms, IncomingCall& out) override;

private:
    void acknowledge(DBusMessage* call);

    DBusConnection* m_conn;
    int m_timeout_ms;
    std::string m_unique_name;
};

} // namespace winpipe::ipc
