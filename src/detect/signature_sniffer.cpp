#include "upload_guard/detect/signature_sniffer.hpp"
#include "upload_guard/common/constants.hpp"
#include "upload_guard/common/logger.hpp"
#include <magic.h>
#include <map>
#include <memory>
#include <type_traits>

namespace upload_guard {
namespace detect {

namespace {

struct MagicCloser {
    void operator()(magic_t cookie) const {
        if (cookie) magic_close(cookie);
    }
};

using MagicHandle = std::unique_ptr<std::remove_pointer<magic_t>::type, MagicCloser>;

struct CookieLookup {
    magic_t cookie = nullptr;
    std::string error;
};

CookieLookup threadCookie(const std::string& database) {
    thread_local std::map<std::string, MagicHandle> cookies;

    auto it = cookies.find(database);
    if (it != cookies.end()) {
        return {it->second.get(), ""};
    }

    MagicHandle handle(magic_open(MAGIC_MIME_TYPE));
    if (!handle) {
        return {nullptr, "magic_open failed"};
    }

    if (magic_load(handle.get(), database.empty() ? nullptr : database.c_str()) != 0) {
        const char* err = magic_error(handle.get());
        return {nullptr, err ? err : "magic_load failed"};
    }

    magic_t cookie = handle.get();
    cookies.emplace(database, std::move(handle));
    return {cookie, ""};
}

}

SignatureSniffer::SignatureSniffer(std::string magic_database)
    : database_(std::move(magic_database)) {}

SniffOutcome SignatureSniffer::sniff(const uint8_t* data, size_t size) const {
    if (size == 0) {
        return SniffOutcome::success(constants::mime::GENERIC);
    }

    auto lookup = threadCookie(database_);
    if (!lookup.cookie) {
        common::ErrorContext ctx;
        ctx.component = "SignatureSniffer";
        ctx.details["database"] = database_.empty() ? "<system>" : database_;
        ctx.details["error"] = lookup.error;
        common::Logger::instance().error("[Sniffer] Database unavailable | {}", common::formatContext(ctx));
        return SniffOutcome::failure(core::ValidationErrorCode::DETECTION_FAILED, lookup.error, ctx);
    }

    const char* mime = magic_buffer(lookup.cookie, data, size);
    if (!mime) {
        const char* err = magic_error(lookup.cookie);
        std::string reason = err ? err : "magic_buffer failed";
        common::ErrorContext ctx;
        ctx.component = "SignatureSniffer";
        ctx.details["size"] = std::to_string(size);
        ctx.details["error"] = reason;
        common::Logger::instance().error("[Sniffer] Detection failed | {}", common::formatContext(ctx));
        return SniffOutcome::failure(core::ValidationErrorCode::DETECTION_FAILED, reason, ctx);
    }

    std::string result(mime);
    if (result.empty()) {
        result = constants::mime::GENERIC;
    }
    return SniffOutcome::success(result);
}

SniffOutcome SignatureSniffer::sniff(const std::string& data) const {
    return sniff(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

bool SignatureSniffer::available() const {
    return threadCookie(database_).cookie != nullptr;
}

}}
