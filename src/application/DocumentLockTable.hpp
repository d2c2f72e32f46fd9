/**
 * @file DocumentLockTable.hpp
 * @brief Per-document mutual exclusion for processing attempts.
 */

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace docudigest::application {

/**
 * @class DocumentLockTable
 * @brief Hands out one mutex per document id; entries are dropped when unused.
 */
class DocumentLockTable {
    struct Entry {
        std::mutex mutex;
        int users = 0; // holders plus waiters, guarded by the table mutex
    };

public:
    /** @brief RAII ownership of one document id. */
    class Guard {
    public:
        Guard(DocumentLockTable* table, std::string id, Entry* entry)
            : m_table(table), m_id(std::move(id)), m_entry(entry) {}
        Guard(Guard&& other) noexcept
            : m_table(other.m_table), m_id(std::move(other.m_id)), m_entry(other.m_entry) {
            other.m_table = nullptr;
            other.m_entry = nullptr;
        }
        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;
        Guard& operator=(Guard&&) = delete;
        ~Guard() {
            if (m_table) m_table->release(m_id, m_entry);
        }

    private:
        DocumentLockTable* m_table;
        std::string m_id;
        Entry* m_entry;
    };

    /** @brief Blocks until the id is free, then owns it. */
    Guard acquire(const std::string& documentId);

    /** @brief Owns the id only if nobody else holds it. */
    std::optional<Guard> tryAcquire(const std::string& documentId);

    /** @brief Number of ids currently tracked (held or awaited). */
    std::size_t size() const;

private:
    Entry* reserve(const std::string& documentId);
    void unreserve(const std::string& documentId, Entry* entry);
    void release(const std::string& documentId, Entry* entry);

    mutable std::mutex m_tableMutex;
    std::map<std::string, std::unique_ptr<Entry>> m_entries;
};

} // namespace docudigest::application
