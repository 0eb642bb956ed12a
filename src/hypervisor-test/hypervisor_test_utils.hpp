#pragma once

#include <gtest/gtest.h>

#include <algorithm>
#include <array>
#include <condition_variable>
#include <csignal>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <vector>

#include <error.hpp>
#include <native_hypervisor.hpp>
#include <virtual_machine.hpp>

#define ASSERT_HYPERVISOR_ERROR(statement, expected_code)                                                                          \
    do                                                                                                                             \
    {                                                                                                                              \
        try                                                                                                                        \
        {                                                                                                                          \
            statement;                                                                                                             \
            FAIL() << "Expected hypervisor_error (" << hvkit::to_string(expected_code) << ")";                                    \
        }                                                                                                                          \
        catch (const hvkit::hypervisor_error& e)                                                                                   \
        {                                                                                                                          \
            ASSERT_EQ(e.code(), expected_code) << e.what();                                                                        \
        }                                                                                                                          \
    } while (false)

namespace test
{
    struct map_call
    {
        void* host_address{};
        uint64_t guest_address{};
        size_t size{};
        uint64_t flags{};
    };

    // Outlives the fake so teardown can be inspected after the VM is gone
    class call_log
    {
      public:
        void add(std::string name)
        {
            std::lock_guard _{this->mutex_};
            this->calls_.push_back(std::move(name));
        }

        std::vector<std::string> get() const
        {
            std::lock_guard _{this->mutex_};
            return this->calls_;
        }

        size_t count(const std::string& name) const
        {
            std::lock_guard _{this->mutex_};
            return static_cast<size_t>(std::ranges::count(this->calls_, name));
        }

        void clear()
        {
            std::lock_guard _{this->mutex_};
            this->calls_.clear();
        }

      private:
        mutable std::mutex mutex_{};
        std::vector<std::string> calls_{};
    };

    // In-process stand-in for the native call surface.
    // Records every call, fails on demand and can block runs until an exit is requested.
    class fake_hypervisor : public hvkit::native_hypervisor
    {
      public:
        std::shared_ptr<call_log> get_call_log() const
        {
            return this->log_;
        }

        void fail(const std::string& call, const hvkit::native_status result)
        {
            std::lock_guard _{this->mutex_};
            this->failures_[call] = result;
        }

        void clear_failure(const std::string& call)
        {
            std::lock_guard _{this->mutex_};
            this->failures_.erase(call);
        }

        void queue_exit(const hvkit::native_exit_record& record)
        {
            std::lock_guard _{this->mutex_};
            this->scripted_exits_.push_back(record);
        }

        // Runs without a scripted exit wait for vcpus_exit
        void set_blocking_runs(const bool value)
        {
            std::lock_guard _{this->mutex_};
            this->blocking_runs_ = value;
        }

        void wait_until_running()
        {
            std::unique_lock lock{this->mutex_};
            this->condition_.wait(lock, [this] { return this->running_vcpus_ > 0; });
        }

        std::vector<map_call> get_map_calls() const
        {
            std::lock_guard _{this->mutex_};
            return this->map_calls_;
        }

        std::vector<map_call> get_protect_calls() const
        {
            std::lock_guard _{this->mutex_};
            return this->protect_calls_;
        }

        std::vector<map_call> get_unmap_calls() const
        {
            std::lock_guard _{this->mutex_};
            return this->unmap_calls_;
        }

        size_t get_vcpu_count() const
        {
            std::lock_guard _{this->mutex_};
            return this->vcpus_.size();
        }

        hvkit::native_status vm_create(hvkit::native_vm_config* config) override
        {
            std::lock_guard _{this->mutex_};
            this->vm_config_ = config;
            return this->record("vm_create");
        }

        hvkit::native_status vm_destroy() override
        {
            std::lock_guard _{this->mutex_};
            return this->record("vm_destroy");
        }

        hvkit::native_status vm_map(void* host_address, const uint64_t guest_address, const size_t size, const uint64_t flags) override
        {
            std::lock_guard _{this->mutex_};
            const auto res = this->record("vm_map");
            if (res == hvkit::status::success)
            {
                this->map_calls_.push_back({host_address, guest_address, size, flags});
            }

            return res;
        }

        hvkit::native_status vm_unmap(const uint64_t guest_address, const size_t size) override
        {
            std::lock_guard _{this->mutex_};
            const auto res = this->record("vm_unmap");
            if (res == hvkit::status::success)
            {
                this->unmap_calls_.push_back({nullptr, guest_address, size, 0});
            }

            return res;
        }

        hvkit::native_status vm_protect(const uint64_t guest_address, const size_t size, const uint64_t flags) override
        {
            std::lock_guard _{this->mutex_};
            const auto res = this->record("vm_protect");
            if (res == hvkit::status::success)
            {
                this->protect_calls_.push_back({nullptr, guest_address, size, flags});
            }

            return res;
        }

        hvkit::native_vcpu_config* vcpu_config_create() override
        {
            std::lock_guard _{this->mutex_};
            if (this->record("vcpu_config_create") != hvkit::status::success)
            {
                return nullptr;
            }

            return reinterpret_cast<hvkit::native_vcpu_config*>(&this->config_storage_);
        }

        void vcpu_config_release(hvkit::native_vcpu_config*) override
        {
            std::lock_guard _{this->mutex_};
            (void)this->record("vcpu_config_release");
        }

        hvkit::native_status vcpu_config_get_feature_reg(hvkit::native_vcpu_config*, const hvkit::arm64_feature_register reg,
                                                         uint64_t& value) override
        {
            std::lock_guard _{this->mutex_};
            const auto res = this->record("vcpu_config_get_feature_reg");
            if (res == hvkit::status::success)
            {
                value = 0x1000 + static_cast<uint64_t>(reg);
            }

            return res;
        }

        hvkit::native_status vcpu_config_get_ccsidr_el1_sys_reg_values(hvkit::native_vcpu_config*, const hvkit::cache_type type,
                                                                       hvkit::ccsidr_values& values) override
        {
            std::lock_guard _{this->mutex_};
            const auto res = this->record("vcpu_config_get_ccsidr_el1_sys_reg_values");
            if (res == hvkit::status::success)
            {
                for (size_t i = 0; i < values.size(); ++i)
                {
                    values[i] = (static_cast<uint64_t>(type) << 8) | i;
                }
            }

            return res;
        }

        hvkit::native_status vcpu_create(hvkit::vcpu_id& vcpu, const hvkit::native_exit_record*& exit,
                                         hvkit::native_vcpu_config* config) override
        {
            std::lock_guard _{this->mutex_};
            const auto res = this->record("vcpu_create");
            if (res != hvkit::status::success)
            {
                return res;
            }

            const auto id = this->next_vcpu_id_++;
            auto& entry = this->vcpus_[id];
            entry = std::make_unique<fake_vcpu>();
            entry->config = config;

            vcpu = id;
            exit = &entry->exit;

            return res;
        }

        hvkit::native_status vcpu_destroy(const hvkit::vcpu_id vcpu) override
        {
            std::lock_guard _{this->mutex_};
            const auto res = this->record("vcpu_destroy");
            if (res == hvkit::status::success)
            {
                this->vcpus_.erase(vcpu);
            }

            return res;
        }

        hvkit::native_status vcpu_run(const hvkit::vcpu_id vcpu) override
        {
            std::unique_lock lock{this->mutex_};
            const auto res = this->record("vcpu_run");
            if (res != hvkit::status::success)
            {
                return res;
            }

            auto* entry = this->find(vcpu);
            if (!entry)
            {
                return hvkit::status::bad_argument;
            }

            entry->pending_irq = false;
            entry->pending_fiq = false;

            if (entry->exit_requested)
            {
                entry->exit_requested = false;
                entry->exit = {};
                entry->exit.reason = static_cast<uint32_t>(hvkit::native_exit_reason::canceled);
                return res;
            }

            if (!this->scripted_exits_.empty())
            {
                entry->exit = this->scripted_exits_.front();
                this->scripted_exits_.pop_front();
                return res;
            }

            if (!this->blocking_runs_)
            {
                entry->exit = {};
                entry->exit.reason = static_cast<uint32_t>(hvkit::native_exit_reason::unknown);
                return res;
            }

            ++this->running_vcpus_;
            this->condition_.notify_all();

            this->condition_.wait(lock, [entry] { return entry->exit_requested; });

            --this->running_vcpus_;

            entry->exit_requested = false;
            entry->exit = {};
            entry->exit.reason = static_cast<uint32_t>(hvkit::native_exit_reason::canceled);

            return res;
        }

        hvkit::native_status vcpus_exit(const std::span<const hvkit::vcpu_id> vcpus) override
        {
            std::lock_guard _{this->mutex_};
            const auto res = this->record("vcpus_exit");
            if (res != hvkit::status::success)
            {
                return res;
            }

            for (const auto id : vcpus)
            {
                if (auto* entry = this->find(id))
                {
                    entry->exit_requested = true;
                }
            }

            this->condition_.notify_all();
            return res;
        }

        hvkit::native_status vcpu_get_reg(const hvkit::vcpu_id vcpu, const hvkit::arm64_register reg, uint64_t& value) override
        {
            return this->read_value(vcpu, "vcpu_get_reg",
                                    [&](const fake_vcpu& entry) { value = entry.registers.at(static_cast<size_t>(reg)); });
        }

        hvkit::native_status vcpu_set_reg(const hvkit::vcpu_id vcpu, const hvkit::arm64_register reg, const uint64_t value) override
        {
            return this->write_value(vcpu, "vcpu_set_reg",
                                     [&](fake_vcpu& entry) { entry.registers.at(static_cast<size_t>(reg)) = value; });
        }

        hvkit::native_status vcpu_get_sys_reg(const hvkit::vcpu_id vcpu, const hvkit::arm64_system_register reg,
                                              uint64_t& value) override
        {
            return this->read_value(vcpu, "vcpu_get_sys_reg", [&](const fake_vcpu& entry) {
                const auto it = entry.system_registers.find(reg);
                value = it == entry.system_registers.end() ? 0 : it->second;
            });
        }

        hvkit::native_status vcpu_set_sys_reg(const hvkit::vcpu_id vcpu, const hvkit::arm64_system_register reg,
                                              const uint64_t value) override
        {
            return this->write_value(vcpu, "vcpu_set_sys_reg", [&](fake_vcpu& entry) { entry.system_registers[reg] = value; });
        }

        hvkit::native_status vcpu_get_pending_interrupt(const hvkit::vcpu_id vcpu, const hvkit::interrupt_type type,
                                                        bool& pending) override
        {
            return this->read_value(vcpu, "vcpu_get_pending_interrupt", [&](const fake_vcpu& entry) {
                pending = type == hvkit::interrupt_type::fiq ? entry.pending_fiq : entry.pending_irq;
            });
        }

        hvkit::native_status vcpu_set_pending_interrupt(const hvkit::vcpu_id vcpu, const hvkit::interrupt_type type,
                                                        const bool pending) override
        {
            return this->write_value(vcpu, "vcpu_set_pending_interrupt", [&](fake_vcpu& entry) {
                (type == hvkit::interrupt_type::fiq ? entry.pending_fiq : entry.pending_irq) = pending;
            });
        }

        hvkit::native_status vcpu_get_trap_debug_exceptions(const hvkit::vcpu_id vcpu, bool& value) override
        {
            return this->read_value(vcpu, "vcpu_get_trap_debug_exceptions",
                                    [&](const fake_vcpu& entry) { value = entry.trap_debug_exceptions; });
        }

        hvkit::native_status vcpu_set_trap_debug_exceptions(const hvkit::vcpu_id vcpu, const bool value) override
        {
            return this->write_value(vcpu, "vcpu_set_trap_debug_exceptions",
                                     [&](fake_vcpu& entry) { entry.trap_debug_exceptions = value; });
        }

        hvkit::native_status vcpu_get_trap_debug_reg_accesses(const hvkit::vcpu_id vcpu, bool& value) override
        {
            return this->read_value(vcpu, "vcpu_get_trap_debug_reg_accesses",
                                    [&](const fake_vcpu& entry) { value = entry.trap_debug_reg_accesses; });
        }

        hvkit::native_status vcpu_set_trap_debug_reg_accesses(const hvkit::vcpu_id vcpu, const bool value) override
        {
            return this->write_value(vcpu, "vcpu_set_trap_debug_reg_accesses",
                                     [&](fake_vcpu& entry) { entry.trap_debug_reg_accesses = value; });
        }

        hvkit::native_status vcpu_get_exec_time(const hvkit::vcpu_id vcpu, uint64_t& time) override
        {
            return this->read_value(vcpu, "vcpu_get_exec_time", [&](const fake_vcpu&) { time = 1234; });
        }

        hvkit::native_status vcpu_get_vtimer_mask(const hvkit::vcpu_id vcpu, bool& masked) override
        {
            return this->read_value(vcpu, "vcpu_get_vtimer_mask", [&](const fake_vcpu& entry) { masked = entry.vtimer_masked; });
        }

        hvkit::native_status vcpu_set_vtimer_mask(const hvkit::vcpu_id vcpu, const bool masked) override
        {
            return this->write_value(vcpu, "vcpu_set_vtimer_mask", [&](fake_vcpu& entry) { entry.vtimer_masked = masked; });
        }

        hvkit::native_status vcpu_get_vtimer_offset(const hvkit::vcpu_id vcpu, uint64_t& offset) override
        {
            return this->read_value(vcpu, "vcpu_get_vtimer_offset", [&](const fake_vcpu& entry) { offset = entry.vtimer_offset; });
        }

        hvkit::native_status vcpu_set_vtimer_offset(const hvkit::vcpu_id vcpu, const uint64_t offset) override
        {
            return this->write_value(vcpu, "vcpu_set_vtimer_offset", [&](fake_vcpu& entry) { entry.vtimer_offset = offset; });
        }

        std::string get_name() const override
        {
            return "Fake";
        }

        hvkit::native_vm_config* get_vm_config() const
        {
            std::lock_guard _{this->mutex_};
            return this->vm_config_;
        }

      private:
        struct fake_vcpu
        {
            hvkit::native_exit_record exit{};
            hvkit::native_vcpu_config* config{};
            bool exit_requested{false};
            bool pending_irq{false};
            bool pending_fiq{false};
            bool trap_debug_exceptions{false};
            bool trap_debug_reg_accesses{false};
            bool vtimer_masked{false};
            uint64_t vtimer_offset{0};
            std::array<uint64_t, static_cast<size_t>(hvkit::arm64_register::end)> registers{};
            std::map<hvkit::arm64_system_register, uint64_t> system_registers{};
        };

        mutable std::mutex mutex_{};
        std::condition_variable condition_{};
        std::shared_ptr<call_log> log_{std::make_shared<call_log>()};
        std::map<std::string, hvkit::native_status> failures_{};
        std::deque<hvkit::native_exit_record> scripted_exits_{};
        std::vector<map_call> map_calls_{};
        std::vector<map_call> unmap_calls_{};
        std::vector<map_call> protect_calls_{};
        std::map<hvkit::vcpu_id, std::unique_ptr<fake_vcpu>> vcpus_{};
        hvkit::vcpu_id next_vcpu_id_{0};
        hvkit::native_vm_config* vm_config_{};
        size_t running_vcpus_{0};
        bool blocking_runs_{false};
        int config_storage_{0};

        hvkit::native_status record(const std::string& call)
        {
            this->log_->add(call);

            const auto entry = this->failures_.find(call);
            return entry == this->failures_.end() ? hvkit::status::success : entry->second;
        }

        fake_vcpu* find(const hvkit::vcpu_id vcpu)
        {
            const auto entry = this->vcpus_.find(vcpu);
            return entry == this->vcpus_.end() ? nullptr : entry->second.get();
        }

        template <typename F>
        hvkit::native_status read_value(const hvkit::vcpu_id vcpu, const std::string& call, const F& reader)
        {
            std::lock_guard _{this->mutex_};
            const auto res = this->record(call);
            if (res != hvkit::status::success)
            {
                return res;
            }

            const auto* entry = this->find(vcpu);
            if (!entry)
            {
                return hvkit::status::bad_argument;
            }

            reader(*entry);
            return res;
        }

        template <typename F>
        hvkit::native_status write_value(const hvkit::vcpu_id vcpu, const std::string& call, const F& writer)
        {
            std::lock_guard _{this->mutex_};
            const auto res = this->record(call);
            if (res != hvkit::status::success)
            {
                return res;
            }

            auto* entry = this->find(vcpu);
            if (!entry)
            {
                return hvkit::status::bad_argument;
            }

            writer(*entry);
            return res;
        }
    };

    struct test_machine
    {
        fake_hypervisor* native{};
        std::shared_ptr<call_log> calls{};
        std::unique_ptr<hvkit::virtual_machine> vm{};
    };

    inline test_machine create_test_machine()
    {
        auto native = std::make_unique<fake_hypervisor>();

        test_machine machine{};
        machine.native = native.get();
        machine.calls = native->get_call_log();

        hvkit::virtual_machine_settings settings{};
        settings.disable_logging = true;

        machine.vm = std::make_unique<hvkit::virtual_machine>(std::move(native), std::nullopt, settings);
        return machine;
    }

    inline bool is_zero_filled(const std::span<const std::byte> data)
    {
        return std::ranges::all_of(data, [](const std::byte value) { return value == std::byte{0}; });
    }
}
