#pragma once

#include <utility>

#include <unicorn/unicorn.h>

namespace hvkit::unicorn
{
    class unicorn_hook
    {
      public:
        unicorn_hook() = default;

        explicit unicorn_hook(uc_engine* uc)
            : uc_(uc)
        {
        }

        ~unicorn_hook()
        {
            this->release();
        }

        unicorn_hook(const unicorn_hook&) = delete;
        unicorn_hook& operator=(const unicorn_hook&) = delete;

        unicorn_hook(unicorn_hook&& obj) noexcept
        {
            this->operator=(std::move(obj));
        }

        unicorn_hook& operator=(unicorn_hook&& obj) noexcept
        {
            if (this != &obj)
            {
                this->release();

                this->uc_ = obj.uc_;
                this->hook_ = obj.hook_;

                obj.hook_ = {};
            }

            return *this;
        }

        uc_hook* make_reference()
        {
            this->release();
            return &this->hook_;
        }

        void release()
        {
            if (this->uc_ && this->hook_)
            {
                (void)uc_hook_del(this->uc_, this->hook_);
            }

            this->hook_ = {};
        }

      private:
        uc_engine* uc_{};
        uc_hook hook_{};
    };
}
