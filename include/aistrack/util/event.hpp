#pragma once

#include "../core/types.hpp"
#include <datapod/datapod.hpp>
#include <functional>
#include <utility>

namespace aistrack {
    namespace util {

        using SubscriptionId = u32;
        inline constexpr SubscriptionId NO_SUBSCRIPTION = 0;

        // ─── Notification hook ───────────────────────────────────────────────────────
        // Services emit outcomes here; delivery (chat, mail, metrics) is the
        // subscriber's business. Subscribers must not (un)subscribe from inside a
        // callback.
        template <typename... Args> class Event {
            struct Subscriber {
                SubscriptionId id = NO_SUBSCRIPTION;
                std::function<void(Args...)> fn;
            };

            dp::Vector<Subscriber> subscribers_;
            SubscriptionId next_id_ = 1;

          public:
            SubscriptionId subscribe(std::function<void(Args...)> fn) {
                SubscriptionId id = next_id_++;
                subscribers_.push_back({id, std::move(fn)});
                return id;
            }

            bool unsubscribe(SubscriptionId id) {
                for (auto it = subscribers_.begin(); it != subscribers_.end(); ++it) {
                    if (it->id == id) {
                        subscribers_.erase(it);
                        return true;
                    }
                }
                return false;
            }

            void emit(Args... args) const {
                for (const auto &s : subscribers_) {
                    if (s.fn)
                        s.fn(args...);
                }
            }

            usize count() const noexcept { return subscribers_.size(); }
        };

    } // namespace util
    using util::Event;
} // namespace aistrack
