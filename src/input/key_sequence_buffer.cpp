#include <navpick/input/key_sequence_buffer.h>

#include <boost/asio/error.hpp>
#include <spdlog/spdlog.h>

#include <utility>

namespace navpick::input {

Result<std::unique_ptr<KeySequenceBuffer>>
KeySequenceBuffer::create(boost::asio::any_io_executor executor, config::KeyBindingsConfig bindings,
                          ActionHandler onAction) {
    if (auto ok = bindings.validate(); !ok) {
        spdlog::warn("[KeySequenceBuffer] Rejected key bindings: {}", ok.error().message);
        return ok.error();
    }
    return std::make_unique<KeySequenceBuffer>(std::move(executor), std::move(bindings),
                                               std::move(onAction));
}

KeySequenceBuffer::KeySequenceBuffer(boost::asio::any_io_executor executor,
                                     config::KeyBindingsConfig bindings, ActionHandler onAction)
    : bindings_(std::move(bindings)), onAction_(std::move(onAction)), timer_(std::move(executor)) {}

KeySequenceBuffer::~KeySequenceBuffer() {
    disarmTimeout();
}

KeyFeedResult KeySequenceBuffer::feed(char key) {
    disarmTimeout();
    const auto now = std::chrono::steady_clock::now();

    // The timer may not have run yet when the loop was busy; an expired buffer still
    // resolves before the new key starts a fresh one.
    if (auto* pending = std::get_if<Pending>(&state_); pending && now >= pending->deadline) {
        Pending expired = std::move(*pending);
        state_ = Empty{};
        resolveExpired(expired);
    }

    if (auto* pending = std::get_if<Pending>(&state_)) {
        Pending previous = *pending;
        auto result = evaluate(previous.buffer + key, previous.firstKeyAt);
        if (result != KeyFeedResult::Unmatched) {
            return result;
        }

        // Diverged. A buffer that was itself bound (waitForLongerMatch) resolves now.
        bool emittedPrevious = false;
        if (auto action = bindings_.actionFor(previous.buffer)) {
            emit(*action);
            emittedPrevious = true;
        } else {
            spdlog::debug("[KeySequenceBuffer] Discarding unmatched sequence '{}{}'",
                          previous.buffer, key);
        }

        result = evaluate(std::string(1, key), now);
        if (result == KeyFeedResult::Unmatched && emittedPrevious) {
            return KeyFeedResult::Matched;
        }
        return result;
    }

    return evaluate(std::string(1, key), now);
}

void KeySequenceBuffer::clear() {
    disarmTimeout();
    state_ = Empty{};
}

KeySequenceSnapshot KeySequenceBuffer::snapshot() const {
    KeySequenceSnapshot snap;
    if (const auto* pending = std::get_if<Pending>(&state_)) {
        snap.state = KeySequenceState::Pending;
        snap.buffer = pending->buffer;
        snap.firstKeyAt = pending->firstKeyAt;
        snap.deadline = pending->deadline;
    }
    return snap;
}

std::string KeySequenceBuffer::pendingSequence() const {
    if (const auto* pending = std::get_if<Pending>(&state_)) {
        return pending->buffer;
    }
    return {};
}

KeyFeedResult KeySequenceBuffer::evaluate(std::string buffer, SteadyTimePoint firstKeyAt) {
    const auto exact = bindings_.actionFor(buffer);
    const bool prefix = bindings_.isStrictPrefix(buffer);

    if (exact && !(prefix && bindings_.waitForLongerMatch)) {
        state_ = Empty{};
        emit(*exact);
        return KeyFeedResult::Matched;
    }

    if (prefix) {
        const auto deadline = firstKeyAt + bindings_.sequenceTimeout;
        state_ = Pending{std::move(buffer), firstKeyAt, deadline};
        armTimeout(deadline);
        return KeyFeedResult::Pending;
    }

    state_ = Empty{};
    return KeyFeedResult::Unmatched;
}

void KeySequenceBuffer::resolveExpired(const Pending& pending) {
    if (auto action = bindings_.actionFor(pending.buffer)) {
        spdlog::debug("[KeySequenceBuffer] Sequence '{}' resolved by timeout", pending.buffer);
        emit(*action);
        return;
    }
    spdlog::debug("[KeySequenceBuffer] Sequence '{}' timed out without a binding", pending.buffer);
}

void KeySequenceBuffer::armTimeout(SteadyTimePoint deadline) {
    const auto generation = generation_;
    std::weak_ptr<char> alive = lifetime_;
    timer_.expires_at(deadline);
    timer_.async_wait([this, generation, alive](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted || alive.expired()) {
            return;
        }
        onTimeout(generation);
    });
}

void KeySequenceBuffer::disarmTimeout() {
    ++generation_;
    timer_.cancel();
}

void KeySequenceBuffer::onTimeout(std::uint64_t generation) {
    if (generation != generation_) {
        return;
    }
    auto* pending = std::get_if<Pending>(&state_);
    if (!pending) {
        return;
    }
    Pending expired = std::move(*pending);
    state_ = Empty{};
    ++generation_;
    resolveExpired(expired);
}

void KeySequenceBuffer::emit(KeyAction action) {
    spdlog::debug("[KeySequenceBuffer] Action {}", keyActionName(action));
    if (onAction_) {
        onAction_(action);
    }
}

} // namespace navpick::input
