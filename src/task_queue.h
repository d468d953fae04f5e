/*
 * This file is part of the LAPIS reconstruction program.
 *
 * Copyright (C) 2026 Helmholtz-Zentrum Dresden-Rossendorf
 *
 * LAPIS is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * LAPIS is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with LAPIS. If not, see <http://www.gnu.org/licenses/>.
 *
 * Date: 17 October 2026
 */

#ifndef LAPIS_TASK_QUEUE_H_
#define LAPIS_TASK_QUEUE_H_

#include <cstddef>
#include <mutex>
#include <queue>
#include <utility>

namespace lapis
{
    /*
     * Work queue shared by the device workers. All tasks are pushed before the workers start,
     * a worker stops as soon as try_pop() fails.
     */
    template <class Object>
    class task_queue
    {
        public:
            /*
             * Item and Object are of the same type but we need this extra template to make use of the
             * nice reference collapsing rules
             */
            template <class Item>
            auto push(Item&& item) -> void
            {
                auto&& lock = std::lock_guard<decltype(mutex_)>{mutex_};
                queue_.push(std::forward<Item>(item));
            }

            auto try_pop(Object& obj) -> bool
            {
                auto&& lock = std::lock_guard<decltype(mutex_)>{mutex_};
                if(queue_.empty())
                    return false;

                obj = std::move(queue_.front());
                queue_.pop();
                return true;
            }

            auto size() -> std::size_t
            {
                auto&& lock = std::lock_guard<decltype(mutex_)>{mutex_};
                return queue_.size();
            }

        private:
            std::mutex mutex_;
            std::queue<Object> queue_;
    };
}

#endif /* LAPIS_TASK_QUEUE_H_ */
