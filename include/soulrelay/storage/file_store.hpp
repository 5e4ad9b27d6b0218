#pragma once

#include <cstdint>
#include <datapod/datapod.hpp>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <soulrelay/identity/soul.hpp>
#include <soulrelay/market/listing.hpp>
#include <soulrelay/market/trade.hpp>
#include <soulrelay/reputation/reputation_event.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace soulrelay::storage {

    using namespace datapod;

    // ===========================================
    // FileStore - append-only record files
    // ===========================================

    /// Each file is a sequence of [u32 length][datapod record] entries.
    /// Souls and reputation events are written once. Listings and trades are re-appended on every
    /// state change; the last record for an id is the current one.
    /// open() cuts a torn tail left by an interrupted append so new records frame correctly.
    class FileStore {
      public:
        static constexpr const char *SOULS_FILE = "souls.dat";
        static constexpr const char *REPUTATION_FILE = "reputation.dat";
        static constexpr const char *LISTINGS_FILE = "listings.dat";
        static constexpr const char *TRADES_FILE = "trades.dat";

        inline FileStore() : is_open_(false), sync_writes_(false) {}

        inline ~FileStore() { close(); }

        FileStore(const FileStore &) = delete;
        FileStore &operator=(const FileStore &) = delete;

        /// Open or create storage at given directory
        inline Result<void, Error> open(const std::string &path, bool sync_writes = false) {
            std::lock_guard<std::mutex> lock(mutex_);
            try {
                base_path_ = path;
                sync_writes_ = sync_writes;

                std::filesystem::create_directories(base_path_);
                for (const char *name : {SOULS_FILE, REPUTATION_FILE, LISTINGS_FILE, TRADES_FILE}) {
                    auto file = base_path_ / name;
                    if (!std::filesystem::exists(file)) {
                        std::ofstream(file, std::ios::binary).close();
                        continue;
                    }

                    auto size = std::filesystem::file_size(file);
                    auto whole = framedLength(file);
                    if (whole < size) {
                        std::filesystem::resize_file(file, whole);
                        std::cerr << "Truncated " << (size - whole) << " torn bytes from " << file.string()
                                  << std::endl;
                    }
                }

                is_open_ = true;
                return Result<void, Error>::ok();
            } catch (const std::exception &e) {
                is_open_ = false;
                return Result<void, Error>::err(Error::io_error(String(e.what())));
            }
        }

        inline void close() {
            std::lock_guard<std::mutex> lock(mutex_);
            is_open_ = false;
        }

        inline bool isOpen() const { return is_open_; }

        inline std::string path() const { return base_path_.string(); }

        /// Records dropped by loads because they failed to decode
        inline size_t skippedRecords() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return skipped_;
        }

        // ===========================================
        // Writes
        // ===========================================

        inline Result<void, Error> appendSoul(const Soul &soul) { return append(SOULS_FILE, soul); }

        inline Result<void, Error> appendReputationEvent(const reputation::ReputationEvent &event) {
            return append(REPUTATION_FILE, event);
        }

        inline Result<void, Error> appendListing(const market::ServiceListing &listing) {
            return append(LISTINGS_FILE, listing);
        }

        inline Result<void, Error> appendTrade(const market::Trade &trade) { return append(TRADES_FILE, trade); }

        // ===========================================
        // Reads
        // ===========================================

        inline std::vector<Soul> loadSouls() { return readAll<Soul>(SOULS_FILE); }

        inline std::vector<reputation::ReputationEvent> loadReputationEvents() {
            return readAll<reputation::ReputationEvent>(REPUTATION_FILE);
        }

        /// Latest state of every listing, in first-written order
        inline std::vector<market::ServiceListing> loadListings() {
            return latestById(readAll<market::ServiceListing>(LISTINGS_FILE));
        }

        /// Latest state of every trade, in first-written order
        inline std::vector<market::Trade> loadTrades() { return latestById(readAll<market::Trade>(TRADES_FILE)); }

      private:
        template <typename T> inline Result<void, Error> append(const char *name, const T &record) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!is_open_) {
                return Result<void, Error>::err(Error::invalid_argument("Store not open"));
            }

            try {
                appendRecord(base_path_ / name, record);
                return Result<void, Error>::ok();
            } catch (const std::exception &e) {
                return Result<void, Error>::err(Error::io_error(String(e.what())));
            }
        }

        template <typename T> inline void appendRecord(const std::filesystem::path &file, const T &record) {
            std::ofstream out(file, std::ios::binary | std::ios::app);
            if (!out)
                throw std::runtime_error("Failed to open " + file.string() + " for writing");

            // Serialize using datapod (need mutable copy)
            T mutable_record = record;
            auto buffer = datapod::serialize(mutable_record);
            u32 len = static_cast<u32>(buffer.size());

            out.write(reinterpret_cast<const char *>(&len), sizeof(len));
            out.write(reinterpret_cast<const char *>(buffer.data()), buffer.size());

            if (sync_writes_) {
                out.flush();
            }
            if (!out)
                throw std::runtime_error("Failed to write " + file.string());
        }

        template <typename T> inline std::vector<T> readAll(const char *name) {
            std::lock_guard<std::mutex> lock(mutex_);
            std::vector<T> records;
            if (!is_open_)
                return records;

            auto file = base_path_ / name;
            std::error_code ec;
            auto remaining = std::filesystem::file_size(file, ec);
            if (ec)
                return records;

            std::ifstream in(file, std::ios::binary);
            if (!in)
                return records;

            size_t skipped = 0;
            while (remaining >= sizeof(u32)) {
                u32 len;
                in.read(reinterpret_cast<char *>(&len), sizeof(len));
                if (!in)
                    break;
                remaining -= sizeof(len);
                if (len > remaining)
                    break; // Torn tail from an interrupted write

                ByteBuf data(len);
                in.read(reinterpret_cast<char *>(data.data()), len);
                if (!in)
                    break;
                remaining -= len;

                try {
                    records.push_back(datapod::deserialize<Mode::NONE, T>(data));
                } catch (const std::exception &e) {
                    skipped++;
                    std::cerr << "Skipping undecodable record in " << file.string() << ": " << e.what() << std::endl;
                }
            }

            skipped_ += skipped;
            return records;
        }

        /// Length of the prefix made of whole [len][record] frames
        inline static std::uintmax_t framedLength(const std::filesystem::path &file) {
            auto size = std::filesystem::file_size(file);
            std::ifstream in(file, std::ios::binary);
            if (!in)
                throw std::runtime_error("Failed to open " + file.string() + " for reading");

            std::uintmax_t offset = 0;
            while (size - offset >= sizeof(u32)) {
                u32 len;
                in.read(reinterpret_cast<char *>(&len), sizeof(len));
                if (!in || len > size - offset - sizeof(u32))
                    break;
                offset += sizeof(u32) + len;
                in.seekg(static_cast<std::streamoff>(offset));
            }
            return offset;
        }

        template <typename T> inline static std::vector<T> latestById(const std::vector<T> &records) {
            std::vector<T> latest;
            std::unordered_map<std::string, size_t> position;
            for (const auto &record : records) {
                std::string id(record.id.c_str());
                auto it = position.find(id);
                if (it == position.end()) {
                    position[id] = latest.size();
                    latest.push_back(record);
                } else {
                    latest[it->second] = record;
                }
            }
            return latest;
        }

        std::filesystem::path base_path_;
        bool is_open_;
        bool sync_writes_;
        size_t skipped_ = 0;
        mutable std::mutex mutex_;
    };

} // namespace soulrelay::storage
