#include "tdma/common/SuccessRecordStore.h"

#include <spdlog/spdlog.h>

#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace tdma::common {

namespace {

using json = nlohmann::json;

}  // namespace

SuccessRecordStore::SuccessRecordStore(std::filesystem::path storagePath)
    : storagePath_(std::move(storagePath)) {}

void SuccessRecordStore::load() {
    records_.clear();

    if (!std::filesystem::exists(storagePath_)) {
        return;
    }

    std::ifstream input(storagePath_);
    if (!input) {
        throw std::runtime_error("Failed to open success record file: " + storagePath_.string());
    }

    json root;
    try {
        input >> root;
    } catch (const json::exception& ex) {
        throw std::runtime_error("Failed to parse success record file (" + storagePath_.string() + "): " + ex.what());
    }
    if (!root.is_array()) {
        throw std::runtime_error("Success record JSON must be an array");
    }

    records_.reserve(root.size());
    for (const auto& entry : root) {
        try {
            records_.push_back(successRecordFromJson(entry));
        } catch (const json::exception& ex) {
            throw std::runtime_error("Malformed success record in " + storagePath_.string() + ": " + ex.what());
        }
    }
    spdlog::debug("Loaded {} success record(s) from {}", records_.size(), storagePath_.string());
}

void SuccessRecordStore::save() const {
    json root = json::array();
    for (const auto& record : records_) {
        root.push_back(toJson(record));
    }

    const auto parent = storagePath_.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            throw std::runtime_error("Failed to create record directory " + parent.string() + ": " + ec.message());
        }
    }
    std::ofstream output(storagePath_, std::ios::trunc);
    if (!output) {
        throw std::runtime_error("Failed to write success record file: " + storagePath_.string());
    }
    output << std::setw(2) << root;
    if (!output) {
        throw std::runtime_error("Failed to flush success record file: " + storagePath_.string());
    }
}

void SuccessRecordStore::append(SuccessRecord record) {
    records_.push_back(std::move(record));
    try {
        save();
    } catch (const std::exception&) {
        records_.pop_back();
        throw;
    }
}

std::string SuccessRecordStore::formatTimestamp(std::chrono::system_clock::time_point tp) {
    auto tt = std::chrono::system_clock::to_time_t(tp);
    std::tm tm = *std::localtime(&tt);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

}  // namespace tdma::common
