#pragma once

#include <navpick/config/selection_config.h>
#include <navpick/core/types.h>
#include <navpick/input/key_action.h>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <variant>

namespace navpick::input {

enum class KeySequenceState { Empty, Pending };

struct KeySequenceSnapshot {
    KeySequenceState state{KeySequenceState::Empty};
    std::string buffer;
    SteadyTimePoint firstKeyAt{};
    SteadyTimePoint deadline{};
};

enum class KeyFeedResult {
    Matched,  // a binding resolved on this keystroke
    Pending,  // the buffer is a strict prefix of a binding; waiting for more keys
    Unmatched // the keystroke resolved to nothing and the buffer is empty again
};

/**
 * KeySequenceBuffer
 *
 * Resolves raw keystrokes into logical actions, supporting multi-character
 * bindings ("gg") alongside single-character ones ("G").
 *
 * State machine:
 *   Empty --key--> [exact match]  emit, Empty
 *                  [strict prefix] Pending(buffer, deadline = first key + timeout)
 *                  [no match]      Empty
 *   Pending --key--> buffer+key evaluated as above; on no match the key is
 *                    re-evaluated alone as a fresh buffer
 *   Pending --timeout--> emit the action bound to the buffer if any, then Empty
 *
 * Timeouts run on a boost::asio::steady_timer bound to the caller's executor, so
 * expiry is serialized with keystrokes. Every keystroke disarms the timer and bumps
 * a generation counter; a timer completion carrying an older generation is ignored.
 *
 * Not thread-safe: feed(), clear() and the timer must share one executor.
 */
class KeySequenceBuffer {
public:
    using ActionHandler = std::function<void(KeyAction)>;

    /**
     * Validate the bindings and construct the buffer.
     * @return InvalidArgument when the bindings are ambiguous (see KeyBindingsConfig::validate)
     */
    static Result<std::unique_ptr<KeySequenceBuffer>> create(boost::asio::any_io_executor executor,
                                                             config::KeyBindingsConfig bindings,
                                                             ActionHandler onAction);

    KeySequenceBuffer(boost::asio::any_io_executor executor, config::KeyBindingsConfig bindings,
                      ActionHandler onAction);
    ~KeySequenceBuffer();

    KeySequenceBuffer(const KeySequenceBuffer&) = delete;
    KeySequenceBuffer& operator=(const KeySequenceBuffer&) = delete;

    KeyFeedResult feed(char key);

    // Drop any pending keys without emitting.
    void clear();

    KeySequenceSnapshot snapshot() const;
    std::string pendingSequence() const;
    bool hasPending() const noexcept { return std::holds_alternative<Pending>(state_); }
    const config::KeyBindingsConfig& bindings() const noexcept { return bindings_; }

private:
    struct Empty {};
    struct Pending {
        std::string buffer;
        SteadyTimePoint firstKeyAt;
        SteadyTimePoint deadline;
    };
    using State = std::variant<Empty, Pending>;

    KeyFeedResult evaluate(std::string buffer, SteadyTimePoint firstKeyAt);
    void resolveExpired(const Pending& pending);
    void armTimeout(SteadyTimePoint deadline);
    void disarmTimeout();
    void onTimeout(std::uint64_t generation);
    void emit(KeyAction action);

    config::KeyBindingsConfig bindings_;
    ActionHandler onAction_;
    boost::asio::steady_timer timer_;
    State state_{Empty{}};
    std::uint64_t generation_{0};
    std::shared_ptr<char> lifetime_{std::make_shared<char>(0)};
};

} // namespace navpick::input
