/*
 * winpipe Callback Listener Implementation
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 * Description: See header for details.
 */
#include <winpipe/ipc/listener.hpp>
#include <spdlog/spdlog.h>

namespace winpipe::ipc {

void MessageLog::append(Message m) {
    std::lock_guard<std::mutex> lk(m_mu);
    m_messages.push_back(std::move(m));
}

std::vector<Message> MessageLog::snapshot() const {
    std::lock_guard<std::mutex> lk(m_mu);
    return m_messages;
}

std::size_t MessageLog::size() const {
    std::lock_guard<std::mutex> lk(m_mu);
    return m_messages.size();
}

Listener::Listener(CallbackChannel& channel, MessageLog& log, std::string marker)
    : m_channel(channel), m_log(log), m_marker(std::move(marker)) {}

Listener::~Listener() {
    stop();
    join();
}

void Listener::start() {
    if (m_thread.joinable()) return;
    m_running = true;
    m_thread = std::thread([this] { loop(); });
}

void Listener::stop() { m_running = false; }

void Listener::join() {
    if (m_thread.joinable()) m_thread.join();
}

bool Listener::wait_finished(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(m_mu);
    return m_cv.wait_for(lk, timeout, [this] { return m_finished; });
}

bool Listener::finished() const {
    std::lock_guard<std::mutex> lk(m_mu);
    return m_finished;
}

void Listener::rethrow_if_failed() {
    std::exception_ptr failure;
    {
        std::lock_guard<std::mutex> lk(m_mu);
        failure = m_failure;
    }
    if (failure) std::rethrow_exception(failure);
}

void Listener::mark_finished() {
    {
        std::lock_guard<std::mutex> lk(m_mu);
        m_finished = true;
    }
    m_cv.notify_all();
}

void Listener::loop() {
    spdlog::debug("listening for callbacks on {}", m_channel.unique_name());
    while (m_running) {
        IncomingCall call;
        try {
            if (!m_channel.poll_call(kPollIntervalMs, call)) continue;
        } catch (...) {
            {
                std::lock_guard<std::mutex> lk(m_mu);
                m_failure = std::current_exception();
            }
            mark_finished();
            return;
        }
        if (!call.payload) {
            spdlog::debug("ignoring call {} from {} without a string argument", call.member, call.sender);
            continue;
        }
        spdlog::debug("callback {} from {}: {}", call.member, call.sender, *call.payload);
        if (call.member == "done") {
            if (*call.payload == m_marker) mark_finished();
            else spdlog::warn("completion call for unknown script '{}'", *call.payload);
            continue;
        }
        m_log.append(Message{call.member, std::move(*call.payload)});
    }
}

} // namespace winpipe::ipc
