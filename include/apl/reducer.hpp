/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file reducer.hpp
 * @brief Pure event reducer: folds one domain event onto a snapshot.
 *
 * Transition table (anything not listed drives status to kCorrupted):
 *
 *   Event                           Legal source               Result
 *   ------------------------------  -------------------------  ----------------
 *   AppCreated                      (nonexistent)              New/NotSelected
 *   AppCreated                      any existing snapshot      unchanged
 *   ExistingInfrastructureSelected  New + NotSelected          New + Selected
 *   AppActivated                    New + Selected             Active
 *   AppDeleted                      New or Active              Deleted
 *   BuildRequested                  any                        unchanged
 *   UnknownEvent                    any                        unchanged
 *
 * An event addressed to a different uuid is out of protocol for the snapshot
 * and corrupts it. Every application increments version by one, so a
 * snapshot's version equals the length of the history folded into it.
 *
 * Apply() never fails and never aborts: illegality is recorded in-band.
 */

#ifndef APL_REDUCER_HPP_
#define APL_REDUCER_HPP_

#include "apl/events.hpp"
#include "apl/snapshot.hpp"
#include "apl/vocabulary.hpp"

#include <variant>

namespace apl {

namespace detail {

inline AppSnapshot Corrupt(AppSnapshot s) noexcept {
  s.status = AppStatus::kCorrupted;
  return s;
}

inline bool IsNewNotSelected(const AppSnapshot& s) noexcept {
  return s.status == AppStatus::kNew && !IsSelected(s.infrastructure);
}

inline bool IsNewSelected(const AppSnapshot& s) noexcept {
  return s.status == AppStatus::kNew && IsSelected(s.infrastructure);
}

}  // namespace detail

/**
 * @brief Compute the snapshot that follows @p current once @p event applies.
 *
 * Pure and deterministic: equal inputs always give equal outputs.
 */
inline AppSnapshot Apply(const AppSnapshot& current,
                         const AppDomainEvent& event) noexcept {
  AppSnapshot next = current;
  next.version = current.version + 1U;

  if (EventUuid(event) != current.uuid) {
    return detail::Corrupt(next);
  }

  return std::visit(
      overloaded{
          [&next](const AppCreated&) noexcept { return next; },
          [&next](const ExistingInfrastructureSelected& e) noexcept {
            if (!detail::IsNewNotSelected(next)) return detail::Corrupt(next);
            next.infrastructure = Selected{ProviderOf(e.target)};
            return next;
          },
          [&next](const AppActivated&) noexcept {
            if (!detail::IsNewSelected(next)) return detail::Corrupt(next);
            next.status = AppStatus::kActive;
            return next;
          },
          [&next](const AppDeleted&) noexcept {
            if (next.status != AppStatus::kNew &&
                next.status != AppStatus::kActive) {
              return detail::Corrupt(next);
            }
            next.status = AppStatus::kDeleted;
            return next;
          },
          [&next](const BuildRequested&) noexcept { return next; },
          [&next](const UnknownEvent&) noexcept { return next; },
      },
      event);
}

/**
 * @brief Fold the first event of a history onto the nonexistent state.
 *
 * AppCreated brings the entity into existence as New/NotSelected. Any other
 * first event has nothing legal to apply to; the result is a Corrupted
 * snapshot for the uuid the event names.
 */
inline AppSnapshot ApplyFirst(const AppDomainEvent& event) noexcept {
  AppSnapshot s{EventUuid(event), AppStatus::kNew, NotSelected{}, 1U};
  if (!std::holds_alternative<AppCreated>(event)) {
    s.status = AppStatus::kCorrupted;
  }
  return s;
}

/**
 * @brief Rebuild a snapshot by folding a whole history.
 *
 * @return Empty for an empty history (the entity does not exist).
 */
inline optional<AppSnapshot> Replay(const EventList& history) noexcept {
  if (history.empty()) return {};
  AppSnapshot s = ApplyFirst(history.front());
  for (size_t i = 1; i < history.size(); ++i) {
    s = Apply(s, history[i]);
  }
  return s;
}

/// Continue folding @p events onto an existing snapshot.
inline AppSnapshot ApplyAll(const AppSnapshot& start,
                            const EventList& events) noexcept {
  AppSnapshot s = start;
  for (const auto& e : events) {
    s = Apply(s, e);
  }
  return s;
}

}  // namespace apl

#endif  // APL_REDUCER_HPP_
