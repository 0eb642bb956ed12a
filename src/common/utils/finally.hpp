#pragma once

#include <type_traits>
#include <utility>

namespace utils
{
    template <typename T>
    class final_action
    {
      public:
        static_assert(!std::is_reference_v<T> && !std::is_const_v<T> && !std::is_volatile_v<T>,
                      "Final action must be a non-const, non-volatile value type");

        explicit final_action(T action) noexcept
            : action_(std::move(action))
        {
        }

        final_action(final_action&& obj) noexcept
            : action_(std::move(obj.action_)),
              invoke_(std::exchange(obj.invoke_, false))
        {
        }

        final_action(const final_action&) = delete;
        final_action& operator=(const final_action&) = delete;
        final_action& operator=(final_action&&) = delete;

        ~final_action() noexcept
        {
            if (this->invoke_)
            {
                this->action_();
            }
        }

        void cancel()
        {
            this->invoke_ = false;
        }

      private:
        T action_;
        bool invoke_{true};
    };

    template <typename F>
    final_action<std::remove_cvref_t<F>> finally(F&& f) noexcept
    {
        return final_action<std::remove_cvref_t<F>>(std::forward<F>(f));
    }
}
