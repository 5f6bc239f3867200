/*
 * winpipe Callback Listener
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   The generated script reports back by calling methods on a private bus
 *   connection: the member name is the tag (result, error, debug, ...) and the
 *   first string argument is the payload. Listener drains that connection on
 *   a worker thread into a MessageLog until it is stopped, and records the
 *   script's "done" call separately so the session can wait for completion.
 *
 * License (MIT): (see full text in args.hpp header)
 */
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace winpipe::ipc {

struct Message {
    std::string tag;
    std::string payload;
};

class MessageLog {
public:
    void append(Message m);
    std::vector<Message> snapshot() const;
    std::size_t size() const;

private:
    mutable std::mutex m_mu;
    std::vector<Message> m_messages;
};

struct IncomingCall {
    std::string member;
    std::optional<std::string> payload; // first argument, if it is a string
    std::string sender;
};

// Receiving side of the callback connection.
class CallbackChannel {
public:
    virtual ~CallbackChannel() = default;
    // Bus name the script must address its calls to.
    virtual const std::string& unique_name() const = 0;
    // Waits up to timeout_ms for one inbound method call. Calls that expect a
    // reply are acknowledged before returning.
    virtual bool poll_call(int timeout_ms, IncomingCall& out) = 0;
};

class Listener {
public:
    static constexpr int kPollIntervalMs = 200;

    Listener(CallbackChannel& channel, MessageLog& log, std::string marker);
    ~Listener();
    Listener(const Listener&) = delete;
    Listener& operator=(const Listener&) = delete;

    void start();
    void stop();
    void join();

    // True once the script's completion call arrived (or the worker failed).
    bool wait_finished(std::chrono::milliseconds timeout);
    bool finished() const;
    // Rethrows whatever ended the worker early. Call after join().
    void rethrow_if_failed();

private:
    void loop();
    void mark_finished();

    CallbackChannel& m_channel;
    MessageLog& m_log;
    std::string m_marker;
    std::thread m_thread;
    std::atomic<bool> m_running{false};
    mutable std::mutex m_mu;
    std::condition_variable m_cv;
    bool m_finished = false;
    std::exception_ptr m_failure;
};

} // namespace winpipe::ipc
