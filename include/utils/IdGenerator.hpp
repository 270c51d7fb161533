#pragma once

#include <string>
#include <random>
#include <sstream>
#include <iomanip>
#include <cstdint>

namespace ledger::utils {

/**
 * @brief Генератор внешних идентификаторов
 *
 * Формат: "<prefix>_xxxxxxxxxxxxxxxx" (64 случайных бита в hex).
 *
 * @note Thread-safe благодаря thread_local генератору
 */
class IdGenerator {
public:
    static std::string generate(const std::string& prefix) {
        thread_local std::random_device rd;
        thread_local std::mt19937_64 gen(rd());
        std::uniform_int_distribution<uint64_t> dist;

        std::ostringstream ss;
        ss << prefix << "_" << std::hex << std::setfill('0') << std::setw(16) << dist(gen);
        return ss.str();
    }

    static std::string transactionId() { return generate("txn"); }
    static std::string entryId() { return generate("led"); }
};

} // namespace ledger::utils
