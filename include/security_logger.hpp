#pragma once

#include <string>
#include <iostream>
#include <chrono>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <openssl/sha.h>
#include <openssl/rand.h>

namespace powgate {

// Logs proof-of-work events using blinded client identifiers (salted hash).
class SecurityLogger {
public:
    enum class Level {
        INFO,
        WARNING,
        ERROR,
        CRITICAL
    };

    enum class EventType {
        ISSUANCE_FAILURE,
        MALFORMED_REQUEST,
        EXTRACTION_FAILURE,
        CHECKSUM_INVALID,
        DIFFICULTY_NOT_MET,
        CONFIGURATION,
        SERVER
    };

    /**
     * Records an event with a blinded client identifier.
     * @param level Severity level; ERROR and CRITICAL go to stderr.
     * @param event The kind of event.
     * @param remote_addr The client address (blinded before logging).
     * @param message Optional descriptive message (sanitized).
     */
    static void log(Level level, EventType event, const std::string& remote_addr,
                    const std::string& message = "") {
        std::string line = format_record(level, event, remote_addr, message);
        if (level == Level::ERROR || level == Level::CRITICAL) {
            std::cerr << line << "\n";
        } else {
            std::cout << line << "\n";
        }
    }

    static std::string format_record(Level level, EventType event, const std::string& remote_addr,
                                     const std::string& message) {
        auto time_t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        struct tm gmt;
        gmtime_r(&time_t, &gmt);

        std::stringstream ss;
        ss << "[" << std::put_time(&gmt, "%Y-%m-%d %H:%M:%S") << " UTC] "
           << "[" << level_to_string(level) << "] "
           << "[" << event_to_string(event) << "] "
           << "ip=" << blind(remote_addr);

        if (!message.empty()) {
            ss << " msg=\"" << sanitize_log_message(message) << "\"";
        }
        return ss.str();
    }

    // "unknown" and "internal" pass through unchanged.
    static std::string blind(const std::string& remote_addr) {
        if (remote_addr.empty() || remote_addr == "unknown" || remote_addr == "internal") {
            return remote_addr.empty() ? "unknown" : remote_addr;
        }

        std::string data = remote_addr + process_salt();
        unsigned char hash[SHA256_DIGEST_LENGTH];
        SHA256(reinterpret_cast<const unsigned char*>(data.c_str()), data.size(), hash);

        std::stringstream hs;
        for (int i = 0; i < 6; i++) hs << std::hex << std::setw(2) << std::setfill('0') << (int)hash[i];
        return "anon_" + hs.str();
    }

    // Drops quotes, backslashes, line breaks and non-printable characters.
    static std::string sanitize_log_message(const std::string& msg) {
        std::string result;
        result.reserve(msg.size());
        for (char c : msg) {
            if (c == '"' || c == '\\' || c == '\n' || c == '\r') {
                result += ' ';
            } else if (std::isprint(static_cast<unsigned char>(c))) {
                result += c;
            }
        }
        return result;
    }

private:
    static const std::string& process_salt() {
        static const std::string salt = [] {
            unsigned char b[32];
            if (RAND_bytes(b, sizeof(b)) != 1) {
                throw std::runtime_error("CSPRNG failure while seeding log blinding salt");
            }
            std::stringstream ss;
            for (unsigned char c : b) ss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
            return ss.str();
        }();
        return salt;
    }

    static std::string level_to_string(Level level) {
        switch (level) {
            case Level::INFO: return "INFO";
            case Level::WARNING: return "WARN";
            case Level::ERROR: return "ERROR";
            case Level::CRITICAL: return "CRIT";
            default: return "UNKNOWN";
        }
    }

    static std::string event_to_string(EventType event) {
        switch (event) {
            case EventType::ISSUANCE_FAILURE: return "ISSUANCE_FAILURE";
            case EventType::MALFORMED_REQUEST: return "MALFORMED";
            case EventType::EXTRACTION_FAILURE: return "EXTRACTION_FAILURE";
            case EventType::CHECKSUM_INVALID: return "CHECKSUM_INVALID";
            case EventType::DIFFICULTY_NOT_MET: return "DIFFICULTY_NOT_MET";
            case EventType::CONFIGURATION: return "CONFIG";
            case EventType::SERVER: return "SERVER";
            default: return "UNKNOWN_EVENT";
        }
    }
};

}
