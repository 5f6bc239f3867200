/*
 * winpipe D-Bus Message Helpers
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   Thin ownership and argument helpers over libdbus messages. Only the
 *   argument shapes KWin's scripting interface uses are covered: string
 *   arguments on calls, an int32 or string in replies, and the leading
 *   string argument of the script's callbacks.
 *
 * License (MIT): (see full text in args.hpp header)
 */
#pragma once
#include <dbus/dbus.h>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace winpipe::ipc {

struct MessageUnref {
    void operator()(DBusMessage* msg) const { dbus_message_unref(msg); }
};
using MessagePtr = std::unique_ptr<DBusMessage, MessageUnref>;

// DBusError that frees itself.
class BusError {
public:
    BusError() { dbus_error_init(&m_err); }
    ~BusError() { dbus_error_free(&m_err); }
    BusError(const BusError&) = delete;
    BusError& operator=(const BusError&) = delete;

    DBusError* get() { return &m_err; }
    bool is_set() const { return dbus_error_is_set(&m_err); }
    bool has_name(const char* name) const { return dbus_error_has_name(&m_err, name); }
    // "<name>: <message>"
    std::string text() const;

private:
    DBusError m_err;
};

MessagePtr new_method_call(const std::string& destination, const std::string& path,
                           const std::string& interface, const std::string& member,
                           const std::vector<std::string>& args = {});

// Reply readers. A reply with a different signature throws IpcError.
std::int32_t reply_int32(DBusMessage* reply);
std::string reply_string(DBusMessage* reply);

// First argument if the body starts with a string, else nullopt.
std::optional<std::string> first_string_arg(DBusMessage* msg);

} // namespace winpipe::ipc
