#pragma once

#include <navpick/config/selection_config.h>
#include <navpick/core/types.h>
#include <navpick/input/key_action.h>
#include <navpick/input/key_event.h>
#include <navpick/input/key_sequence_buffer.h>
#include <navpick/paging/paged_data_source.h>
#include <navpick/search/fuzzy_matcher.h>
#include <navpick/tui/picker_engine.hpp>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/steady_timer.hpp>

#include <spdlog/spdlog.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace navpick::tui {

// Filter: printable keys edit the query. Navigate: printable keys go through the key bindings.
enum class InputMode { Filter, Navigate };

/**
 * PickerController
 *
 * Drives one PickerEngine from raw key events on the session executor.
 *
 * Key handling:
 *   Enter / Escape          confirm / cancel
 *   Backspace               delete the last query character
 *   Up Down PageUp PageDown Home End
 *                           cursor movement
 *   Tab                     toggle Filter and Navigate mode
 *   printable (Filter)      appended to the query
 *   printable (Navigate)    resolved through the KeySequenceBuffer; the Search action
 *                           enters Filter mode, Back cancels
 *
 * The completion handler receives the outcome exactly once: on confirm, cancel,
 * inactivity timeout (TimedOut), when the first load produced nothing (Empty), or
 * when autoSelectSingle picks the only candidate. The controller must not be
 * destroyed from inside the completion handler.
 */
template <typename T> class PickerController {
public:
    using Engine = PickerEngine<T>;
    using RenderCallback = std::function<void(const PickerController&)>;
    using CompletionHandler = std::function<void(const SelectionOutcome<T>&)>;

    /**
     * @param items    candidates known up front (may be empty)
     * @param source   optional paged source; its pages are appended to items
     * @return InvalidArgument for invalid key bindings or paging options
     */
    static Result<std::unique_ptr<PickerController>>
    create(boost::asio::any_io_executor executor, config::SelectionOptions options,
           config::KeyBindingsConfig bindings, search::KeyExtractor<T> keys, std::vector<T> items,
           std::shared_ptr<paging::IPagedDataSource<T>> source, RenderCallback render,
           CompletionHandler onComplete) {
        std::unique_ptr<PickerController> ctl(new PickerController(
            executor, std::move(options), std::move(keys), std::move(items), std::move(render),
            std::move(onComplete)));

        auto buffer = input::KeySequenceBuffer::create(
            executor, std::move(bindings),
            [raw = ctl.get()](input::KeyAction action) { raw->applyAction(action); });
        if (!buffer) {
            return buffer.error();
        }
        ctl->sequences_ = std::move(buffer).value();

        if (source) {
            if (auto attached = ctl->engine_->attachSource(executor, std::move(source));
                !attached) {
                spdlog::warn("[PickerController] Cannot attach data source: {}",
                             attached.error().message);
                return attached.error();
            }
        }
        return ctl;
    }

    ~PickerController() {
        ++timerGeneration_;
        inactivity_.cancel();
    }

    PickerController(const PickerController&) = delete;
    PickerController& operator=(const PickerController&) = delete;

    // Render the initial state, request the first page and arm the inactivity timeout.
    Result<void> start() {
        if (started_) {
            return Error{ErrorCode::InvalidState, "Picker already started"};
        }
        started_ = true;
        auto r = engine_->start();
        if (!completed_) {
            armInactivity();
        }
        return r;
    }

    /// @return false when the key was ignored (session finished, or nothing bound)
    bool handleKey(const input::KeyEvent& ev) {
        if (completed_) {
            spdlog::debug("[PickerController] Key ignored after completion");
            return false;
        }
        armInactivity();

        using input::Key;
        switch (ev.key) {
            case Key::Enter:
                sequences_->clear();
                engine_->confirm();
                return true;
            case Key::Escape:
                sequences_->clear();
                engine_->cancel();
                return true;
            case Key::Backspace:
                engine_->backspace();
                return true;
            case Key::Tab:
                setMode(mode_ == InputMode::Filter ? InputMode::Navigate : InputMode::Filter);
                return true;
            case Key::Up:
                sequences_->clear();
                engine_->moveUp();
                return true;
            case Key::Down:
                sequences_->clear();
                engine_->moveDown();
                return true;
            case Key::PageUp:
                sequences_->clear();
                engine_->pageUp();
                return true;
            case Key::PageDown:
                sequences_->clear();
                engine_->pageDown();
                return true;
            case Key::Home:
                sequences_->clear();
                engine_->top();
                return true;
            case Key::End:
                sequences_->clear();
                engine_->bottom();
                return true;
            case Key::Character:
                return handleCharacter(ev.ch);
        }
        return false;
    }

    const Engine& engine() const noexcept { return *engine_; }
    Engine& engine() noexcept { return *engine_; }
    InputMode mode() const noexcept { return mode_; }
    std::string pendingKeys() const { return sequences_ ? sequences_->pendingSequence() : ""; }
    bool finished() const noexcept { return completed_; }
    const SelectionOutcome<T>& outcome() const noexcept { return engine_->outcome(); }

private:
    PickerController(boost::asio::any_io_executor executor, config::SelectionOptions options,
                     search::KeyExtractor<T> keys, std::vector<T> items, RenderCallback render,
                     CompletionHandler onComplete)
        : timeout_(options.pickerTimeout), autoSelectSingle_(options.autoSelectSingle),
          mode_(options.enableFuzzySearch ? InputMode::Filter : InputMode::Navigate),
          render_(std::move(render)), onComplete_(std::move(onComplete)),
          inactivity_(std::move(executor)) {
        engine_ = std::make_unique<Engine>(std::move(options), std::move(keys), std::move(items),
                                           [this](const Engine&) { onEngineChanged(); });
    }

    bool handleCharacter(char c) {
        const auto uc = static_cast<unsigned char>(c);
        if (uc < 0x20 || uc == 0x7f) {
            return false;
        }
        if (mode_ == InputMode::Filter) {
            engine_->typeChar(c);
            return true;
        }
        return sequences_->feed(c) != input::KeyFeedResult::Unmatched;
    }

    void applyAction(input::KeyAction action) {
        if (completed_) {
            return;
        }
        using input::KeyAction;
        switch (action) {
            case KeyAction::MoveDown:
                engine_->moveDown();
                break;
            case KeyAction::MoveUp:
                engine_->moveUp();
                break;
            case KeyAction::PageDown:
                engine_->pageDown();
                break;
            case KeyAction::PageUp:
                engine_->pageUp();
                break;
            case KeyAction::Top:
                engine_->top();
                break;
            case KeyAction::Bottom:
                engine_->bottom();
                break;
            case KeyAction::Enter:
                engine_->confirm();
                break;
            case KeyAction::Back:
            case KeyAction::Cancel:
                engine_->cancel();
                break;
            case KeyAction::Search:
                setMode(InputMode::Filter);
                break;
            case KeyAction::Refresh:
                if (engine_->lastFetchError()) {
                    if (auto r = engine_->retryFetch(); !r) {
                        spdlog::debug("[PickerController] Retry not issued: {}",
                                      r.error().message);
                    }
                }
                break;
            default:
                spdlog::debug("[PickerController] Action {} has no effect in the picker",
                              input::keyActionName(action));
                break;
        }
    }

    void setMode(InputMode mode) {
        if (mode == InputMode::Filter && !engine_->options().enableFuzzySearch) {
            spdlog::debug("[PickerController] Fuzzy search disabled; staying in navigate mode");
            return;
        }
        if (mode_ == mode) {
            return;
        }
        mode_ = mode;
        sequences_->clear();
        spdlog::debug("[PickerController] Mode -> {}",
                      mode_ == InputMode::Filter ? "filter" : "navigate");
        if (render_) {
            render_(*this);
        }
    }

    void onEngineChanged() {
        if (render_) {
            render_(*this);
        }
        if (engine_->closed()) {
            finish();
            return;
        }
        checkInitialLoad();
    }

    // Decide Empty / auto-select once the first load has settled.
    void checkInitialLoad() {
        if (initialChecked_ || !started_) {
            return;
        }
        if (engine_->hasSource() && engine_->pagesLoaded() == 0) {
            return;
        }
        const std::size_t count = engine_->candidateCount();
        if (count == 0 && engine_->hasMore()) {
            return;
        }
        initialChecked_ = true;
        if (count == 0) {
            engine_->cancel(SelectionStatus::Empty);
        } else if (autoSelectSingle_ && count == 1 && !engine_->hasMore()) {
            spdlog::debug("[PickerController] Single candidate; selecting automatically");
            engine_->confirm();
        }
    }

    void finish() {
        if (completed_) {
            return;
        }
        completed_ = true;
        ++timerGeneration_;
        inactivity_.cancel();
        if (sequences_) {
            sequences_->clear();
        }
        if (onComplete_) {
            onComplete_(engine_->outcome());
        }
    }

    void armInactivity() {
        if (!timeout_ || completed_) {
            return;
        }
        const auto generation = ++timerGeneration_;
        std::weak_ptr<char> alive = lifetime_;
        inactivity_.expires_after(*timeout_);
        inactivity_.async_wait([this, generation, alive](const boost::system::error_code& ec) {
            if (ec == boost::asio::error::operation_aborted || alive.expired()) {
                return;
            }
            if (generation != timerGeneration_ || completed_) {
                return;
            }
            spdlog::info("[PickerController] Picker timed out after {} ms", timeout_->count());
            engine_->cancel(SelectionStatus::TimedOut);
        });
    }

    std::optional<std::chrono::milliseconds> timeout_;
    bool autoSelectSingle_;
    InputMode mode_;
    RenderCallback render_;
    CompletionHandler onComplete_;

    std::unique_ptr<Engine> engine_;
    std::unique_ptr<input::KeySequenceBuffer> sequences_;
    boost::asio::steady_timer inactivity_;
    std::uint64_t timerGeneration_{0};
    bool started_{false};
    bool initialChecked_{false};
    bool completed_{false};
    std::shared_ptr<char> lifetime_{std::make_shared<char>(0)};
};

} // namespace navpick::tui
