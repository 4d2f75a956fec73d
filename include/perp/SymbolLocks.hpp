#pragma once
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace perp {

/*
One mutex per key, created on first use and kept for the life of the table.
Workflows on the same key run one at a time; different keys do not contend
beyond the brief table lookup.
*/
class SymbolLocks {
public:
    std::unique_lock<std::mutex> acquire(const std::string& key) {
        std::mutex* m = nullptr;
        {
            std::lock_guard<std::mutex> lk(table_m_);
            auto& slot = locks_[key];
            if (!slot) slot = std::make_unique<std::mutex>();
            m = slot.get();
        }
        return std::unique_lock<std::mutex>(*m);
    }

    size_t size() const {
        std::lock_guard<std::mutex> lk(table_m_);
        return locks_.size();
    }

private:
    mutable std::mutex table_m_;
    std::unordered_map<std::string, std::unique_ptr<std::mutex>> locks_;
};

} // namespace perp
