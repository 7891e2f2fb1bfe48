#include "hostlink/actions.hpp"

#include <iterator>
#include <utility>

namespace hostlink {

    void action_queue::push(queued_action action) {
        std::lock_guard lock{mutex_};
        pending_.push_back(std::move(action));
    }

    std::vector<queued_action> action_queue::take_all() {
        std::deque<queued_action> taken{};
        {
            std::lock_guard lock{mutex_};
            taken.swap(pending_);
        }
        return {std::make_move_iterator(taken.begin()), std::make_move_iterator(taken.end())};
    }

    std::vector<queued_action> action_queue::snapshot() const {
        std::lock_guard lock{mutex_};
        return {pending_.begin(), pending_.end()};
    }

    std::size_t action_queue::size() const {
        std::lock_guard lock{mutex_};
        return pending_.size();
    }

}  // namespace hostlink
