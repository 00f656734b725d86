#pragma once

#include "tdma/common/SlotTypes.h"

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace tdma::common {

/**
 * @brief Append-only store of success rounds backed by a single JSON array file.
 *
 * The whole file is read by load() and rewritten by every save(). There is no
 * locking across processes; the last writer wins.
 */
class SuccessRecordStore {
public:
    explicit SuccessRecordStore(std::filesystem::path storagePath);

    /**
     * @brief Replace the in-memory records with the file contents.
     *
     * A missing file yields an empty store. A file that is not a JSON array of
     * record objects raises std::runtime_error.
     */
    void load();

    /**
     * @brief Rewrite the file with every in-memory record.
     */
    void save() const;

    /**
     * @brief Append @p record and persist the full collection.
     *
     * When the write fails the record is dropped again and the error
     * propagates, so size() only counts records that reached the file.
     */
    void append(SuccessRecord record);

    const std::vector<SuccessRecord>& records() const noexcept { return records_; }
    std::size_t size() const noexcept { return records_.size(); }
    const std::filesystem::path& path() const noexcept { return storagePath_; }

    static std::string formatTimestamp(std::chrono::system_clock::time_point tp);

private:
    std::filesystem::path storagePath_;
    std::vector<SuccessRecord> records_;
};

}  // namespace tdma::common
