#include "application/DocumentLockTable.hpp"

namespace docudigest::application {

DocumentLockTable::Entry* DocumentLockTable::reserve(const std::string& documentId) {
    std::lock_guard<std::mutex> lock(m_tableMutex);
    auto& slot = m_entries[documentId];
    if (!slot) {
        slot = std::make_unique<Entry>();
    }
    slot->users += 1;
    return slot.get();
}

void DocumentLockTable::unreserve(const std::string& documentId, Entry* entry) {
    std::lock_guard<std::mutex> lock(m_tableMutex);
    entry->users -= 1;
    if (entry->users == 0) {
        m_entries.erase(documentId);
    }
}

DocumentLockTable::Guard DocumentLockTable::acquire(const std::string& documentId) {
    Entry* entry = reserve(documentId);
    entry->mutex.lock();
    return Guard(this, documentId, entry);
}

std::optional<DocumentLockTable::Guard> DocumentLockTable::tryAcquire(const std::string& documentId) {
    Entry* entry = reserve(documentId);
    if (!entry->mutex.try_lock()) {
        unreserve(documentId, entry);
        return std::nullopt;
    }
    return Guard(this, documentId, entry);
}

void DocumentLockTable::release(const std::string& documentId, Entry* entry) {
    entry->mutex.unlock();
    unreserve(documentId, entry);
}

std::size_t DocumentLockTable::size() const {
    std::lock_guard<std::mutex> lock(m_tableMutex);
    return m_entries.size();
}

} // namespace docudigest::application
