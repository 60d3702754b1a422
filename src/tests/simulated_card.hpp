#ifndef SEVAULT_TEST_SIMULATED_CARD_HPP
#define SEVAULT_TEST_SIMULATED_CARD_HPP

#include <algorithm>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "config/client_config.hpp"
#include "crypto/digest.hpp"
#include "protocol/status.hpp"
#include "transport/transport.hpp"
#include "test_utils.hpp"

// In-memory stand-in for the record applets. Verifies read signatures with
// the public key it was personalized with, like the real card.
class SimulatedCard : public sevault::transport::Transport {
public:
    enum class Mode {
        CHUNKED,
        FIXED
    };

    static constexpr std::size_t MAX_RECORDS = 20;
    static constexpr std::size_t READ_BUFFER_SIZE = 240;
    static constexpr std::size_t FIXED_USER = 32;
    static constexpr std::size_t FIXED_ADDR = 64;
    static constexpr std::size_t FIXED_MESSAGE = 32;

    SimulatedCard(Mode mode, const std::string& public_key_pem,
                  sevault::config::DigestPolicy policy = sevault::config::DigestPolicy::MESSAGE)
        : mode_(mode)
        , public_key_(test_keys::load_public_key(public_key_pem))
        , policy_(policy) {}

    std::vector<uint8_t> transmit(const std::vector<uint8_t>& command) override {
        commands_.push_back(command);
        if (command.size() < 4) {
            return status(sevault::protocol::SW_WRONG_LENGTH);
        }

        uint8_t ins = command[1];
        ++exchanges_[ins];

        auto injected = injected_.find(ins);
        if (injected != injected_.end()) {
            uint16_t sw = injected->second;
            injected_.erase(injected);
            operation_ = Operation::NONE;
            return status(sw);
        }

        std::vector<uint8_t> data;
        std::optional<uint8_t> le;
        if (!parse(command, data, le)) {
            return status(sevault::protocol::SW_WRONG_LENGTH);
        }

        if (mode_ == Mode::FIXED) {
            switch (ins) {
                case 0x10: return fixed_store(data);
                case 0x20: return fixed_read(data);
                case 0x30: return fixed_delete(data);
                default:   return status(sevault::protocol::SW_INS_NOT_SUPPORTED);
            }
        }

        switch (ins) {
            case 0x10: return store_init(data);
            case 0x11: return store_continue(data);
            case 0x12: return store_finalize();
            case 0x20: return read_init(data);
            case 0x21: return read_continue(le.value_or(0));
            case 0x22: return read_finalize();
            default:   return status(sevault::protocol::SW_INS_NOT_SUPPORTED);
        }
    }

    // Makes the next exchange with this INS answer sw
    void fail_next(uint8_t ins, uint16_t sw) { injected_[ins] = sw; }

    int exchanges(uint8_t ins) const {
        auto it = exchanges_.find(ins);
        return it == exchanges_.end() ? 0 : it->second;
    }

    int total_exchanges() const { return static_cast<int>(commands_.size()); }
    const std::vector<std::vector<uint8_t>>& commands() const { return commands_; }
    std::size_t record_count() const { return records_.size(); }
    void reset_counters() { exchanges_.clear(); commands_.clear(); }

private:
    enum class Operation {
        NONE,
        STORE,
        READ
    };

    struct Record {
        std::vector<uint8_t> username;
        std::vector<uint8_t> address;
        std::vector<uint8_t> payload;
    };

    Mode mode_;
    test_keys::PkeyPtr public_key_;
    sevault::config::DigestPolicy policy_;
    std::vector<Record> records_;

    Operation operation_ = Operation::NONE;
    Record pending_;
    std::size_t read_index_ = 0;
    std::size_t read_offset_ = 0;

    std::map<uint8_t, int> exchanges_;
    std::map<uint8_t, uint16_t> injected_;
    std::vector<std::vector<uint8_t>> commands_;

    static std::vector<uint8_t> status(uint16_t sw, std::vector<uint8_t> data = {}) {
        data.push_back(static_cast<uint8_t>(sw >> 8));
        data.push_back(static_cast<uint8_t>(sw & 0xFF));
        return data;
    }

    static bool parse(const std::vector<uint8_t>& command, std::vector<uint8_t>& data, std::optional<uint8_t>& le) {
        if (command.size() == 4) {
            return true;
        }
        std::size_t lc = command[4];
        if (lc == 0) {
            if (command.size() != 6) {
                return false;
            }
            le = command[5];
            return true;
        }
        if (command.size() < 5 + lc || command.size() > 6 + lc) {
            return false;
        }
        data.assign(command.begin() + 5, command.begin() + 5 + lc);
        if (command.size() == 6 + lc) {
            le = command.back();
        }
        return true;
    }

    // Reads [len][bytes] at offset, false when the field runs past the end
    static bool take_field(const std::vector<uint8_t>& data, std::size_t& offset, std::vector<uint8_t>& field) {
        if (offset >= data.size()) {
            return false;
        }
        std::size_t length = data[offset++];
        if (offset + length > data.size()) {
            return false;
        }
        field.assign(data.begin() + offset, data.begin() + offset + length);
        offset += length;
        return true;
    }

    bool signature_valid(std::vector<uint8_t> signed_bytes, const std::vector<uint8_t>& signature) const {
        if (policy_ == sevault::config::DigestPolicy::SHA256_DIGEST) {
            signed_bytes = sevault::crypto::sha256(signed_bytes);
        }
        return test_keys::verify(public_key_.get(), signed_bytes, signature);
    }

    int find(const std::vector<uint8_t>& username, const std::vector<uint8_t>& address) const {
        for (std::size_t i = 0; i < records_.size(); ++i) {
            if (records_[i].username == username && records_[i].address == address) {
                return static_cast<int>(i);
            }
        }
        return -1;
    }


    // ---- CHUNKED APPLET ----

    std::vector<uint8_t> store_init(const std::vector<uint8_t>& data) {
        Record record;
        std::size_t offset = 0;
        if (!take_field(data, offset, record.username) || !take_field(data, offset, record.address) ||
            offset != data.size()) {
            return status(sevault::protocol::SW_WRONG_LENGTH);
        }
        if (find(record.username, record.address) < 0 && records_.size() >= MAX_RECORDS) {
            return status(sevault::protocol::SW_FILE_FULL);
        }
        pending_ = record;
        operation_ = Operation::STORE;
        return status(sevault::protocol::SW_SUCCESS);
    }

    std::vector<uint8_t> store_continue(const std::vector<uint8_t>& data) {
        if (operation_ != Operation::STORE) {
            return status(sevault::protocol::SW_CONDITIONS_NOT_SATISFIED);
        }
        pending_.payload.insert(pending_.payload.end(), data.begin(), data.end());
        return status(sevault::protocol::SW_SUCCESS);
    }

    std::vector<uint8_t> store_finalize() {
        if (operation_ != Operation::STORE) {
            return status(sevault::protocol::SW_CONDITIONS_NOT_SATISFIED);
        }
        int existing = find(pending_.username, pending_.address);
        if (existing >= 0) {
            records_[existing] = pending_;
        } else {
            records_.push_back(pending_);
        }
        operation_ = Operation::NONE;
        return status(sevault::protocol::SW_SUCCESS);
    }

    std::vector<uint8_t> read_init(const std::vector<uint8_t>& data) {
        std::vector<uint8_t> username, address, signature;
        std::size_t offset = 0;
        if (!take_field(data, offset, username) || !take_field(data, offset, address) ||
            !take_field(data, offset, signature) || offset != data.size() || signature.empty()) {
            return status(sevault::protocol::SW_WRONG_LENGTH);
        }

        std::vector<uint8_t> canonical(username);
        canonical.insert(canonical.end(), address.begin(), address.end());
        if (!signature_valid(canonical, signature)) {
            return status(sevault::protocol::SW_VERIFICATION_FAILED);
        }

        int index = find(username, address);
        if (index < 0) {
            return status(sevault::protocol::SW_RECORD_NOT_FOUND);
        }

        operation_ = Operation::READ;
        read_index_ = static_cast<std::size_t>(index);
        read_offset_ = 0;
        std::size_t length = records_[read_index_].payload.size();
        return status(sevault::protocol::SW_SUCCESS,
                      {static_cast<uint8_t>(length >> 8), static_cast<uint8_t>(length & 0xFF)});
    }

    std::vector<uint8_t> read_continue(uint8_t le) {
        if (operation_ != Operation::READ) {
            return status(sevault::protocol::SW_CONDITIONS_NOT_SATISFIED);
        }
        const std::vector<uint8_t>& payload = records_[read_index_].payload;
        if (read_offset_ >= payload.size()) {
            operation_ = Operation::NONE;
            return status(sevault::protocol::SW_SUCCESS);
        }

        std::size_t limit = le == 0 ? READ_BUFFER_SIZE : std::min<std::size_t>(le, READ_BUFFER_SIZE);
        std::size_t chunk = std::min(limit, payload.size() - read_offset_);
        std::vector<uint8_t> out(payload.begin() + read_offset_, payload.begin() + read_offset_ + chunk);
        read_offset_ += chunk;

        std::size_t remaining = payload.size() - read_offset_;
        if (remaining > 0) {
            return status(static_cast<uint16_t>(0x6100 | std::min<std::size_t>(remaining, 0xFF)), out);
        }
        // Auto-reset after the last chunk
        operation_ = Operation::NONE;
        return status(sevault::protocol::SW_SUCCESS, out);
    }

    std::vector<uint8_t> read_finalize() {
        if (operation_ != Operation::READ) {
            return status(sevault::protocol::SW_CONDITIONS_NOT_SATISFIED);
        }
        operation_ = Operation::NONE;
        return status(sevault::protocol::SW_SUCCESS);
    }


    // ---- FIXED-LENGTH APPLET ----

    std::vector<uint8_t> fixed_store(const std::vector<uint8_t>& data) {
        if (data.size() != FIXED_USER + FIXED_ADDR + FIXED_MESSAGE) {
            return status(sevault::protocol::SW_WRONG_LENGTH);
        }
        Record record;
        record.username.assign(data.begin(), data.begin() + FIXED_USER);
        record.address.assign(data.begin() + FIXED_USER, data.begin() + FIXED_USER + FIXED_ADDR);
        record.payload.assign(data.begin() + FIXED_USER + FIXED_ADDR, data.end());

        int index = find(record.username, record.address);
        if (index >= 0) {
            records_[index] = record;
        } else if (records_.size() >= MAX_RECORDS) {
            return status(sevault::protocol::SW_FILE_FULL);
        } else {
            records_.push_back(record);
            index = static_cast<int>(records_.size() - 1);
        }
        return status(sevault::protocol::SW_SUCCESS,
                      {static_cast<uint8_t>(index), static_cast<uint8_t>(records_.size())});
    }

    // Record index, or -1 with failure set to the status to answer
    int fixed_authorize(const std::vector<uint8_t>& data, uint16_t& failure) const {
        if (data.size() <= FIXED_USER + FIXED_ADDR) {
            failure = sevault::protocol::SW_WRONG_LENGTH;
            return -1;
        }
        std::vector<uint8_t> identity(data.begin(), data.begin() + FIXED_USER + FIXED_ADDR);
        std::vector<uint8_t> signature(data.begin() + FIXED_USER + FIXED_ADDR, data.end());
        if (!signature_valid(identity, signature)) {
            failure = sevault::protocol::SW_SIGNATURE_INVALID;
            return -1;
        }
        int index = find(std::vector<uint8_t>(identity.begin(), identity.begin() + FIXED_USER),
                         std::vector<uint8_t>(identity.begin() + FIXED_USER, identity.end()));
        if (index < 0) {
            failure = sevault::protocol::SW_RECORD_NOT_FOUND;
        }
        return index;
    }

    std::vector<uint8_t> fixed_read(const std::vector<uint8_t>& data) {
        uint16_t failure = 0;
        int index = fixed_authorize(data, failure);
        if (index < 0) {
            return status(failure);
        }
        return status(sevault::protocol::SW_SUCCESS, records_[index].payload);
    }

    std::vector<uint8_t> fixed_delete(const std::vector<uint8_t>& data) {
        uint16_t failure = 0;
        int index = fixed_authorize(data, failure);
        if (index < 0) {
            return status(failure);
        }
        records_.erase(records_.begin() + index);
        return status(sevault::protocol::SW_SUCCESS,
                      {static_cast<uint8_t>(index), static_cast<uint8_t>(records_.size())});
    }
};

#endif // SEVAULT_TEST_SIMULATED_CARD_HPP
