// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "upload_record.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace stratus {
namespace store {

namespace {

constexpr const char* kTimestampFormat = "%Y-%m-%dT%H:%M:%SZ";

Result<UploadRecord> corrupt(const std::string& message) {
  return Result<UploadRecord>::Failure(StoreErrorKind::CORRUPT_STATE, message);
}

}  // namespace

int UploadRecord::lastPartNumber() const {
  int last = 0;
  for (const auto& part : parts) {
    last = std::max(last, part.number);
  }
  return last;
}

std::string formatTimestamp(std::chrono::system_clock::time_point time) {
  auto seconds = std::chrono::system_clock::to_time_t(time);
  std::tm tm{};
  gmtime_r(&seconds, &tm);

  std::ostringstream ss;
  ss << std::put_time(&tm, kTimestampFormat);
  return ss.str();
}

std::optional<std::chrono::system_clock::time_point> parseTimestamp(const std::string& text) {
  std::tm tm{};
  std::istringstream ss(text);
  ss >> std::get_time(&tm, kTimestampFormat);
  if (ss.fail()) {
    return std::nullopt;
  }
  // Trailing characters mean the text only started like a timestamp
  ss.peek();
  if (!ss.eof()) {
    return std::nullopt;
  }
  return std::chrono::system_clock::from_time_t(timegm(&tm));
}

Result<std::string> encodeUploadRecord(const UploadRecord& record) {
  nlohmann::json parts = nlohmann::json::array();
  for (const auto& part : record.parts) {
    parts.push_back(
      {{"number", part.number}, {"size_in_bytes", part.size_in_bytes}, {"etag", part.etag}}
    );
  }

  nlohmann::json doc = {
    {"file_id", record.file_id},
    {"upload_id", record.upload_id},
    {"metadata", record.metadata},
    {"upload_length", record.upload_length},
    {"upload_offset", record.upload_offset},
    {"parts", parts},
    {"expires", formatTimestamp(record.expires)},
    {"created_at", formatTimestamp(record.created_at)},
  };
  try {
    return Result<std::string>::Success(doc.dump());
  } catch (const nlohmann::json::type_error& e) {
    return Result<std::string>::Failure(
      StoreErrorKind::INVALID_ARGUMENT,
      "upload record " + record.file_id + " is not encodable: " + e.what()
    );
  }
}

Result<UploadRecord> decodeUploadRecord(const std::string& json) {
  nlohmann::json doc = nlohmann::json::parse(json, nullptr, false);
  if (doc.is_discarded() || !doc.is_object()) {
    return corrupt("upload record is not a JSON object");
  }

  UploadRecord record;
  try {
    record.file_id = doc.at("file_id").get<std::string>();
    record.upload_id = doc.at("upload_id").get<std::string>();
    record.metadata = doc.value("metadata", std::string());
    record.upload_length = doc.at("upload_length").get<int64_t>();
    record.upload_offset = doc.at("upload_offset").get<int64_t>();

    for (const auto& part : doc.at("parts")) {
      PartRecord p;
      p.number = part.at("number").get<int>();
      p.size_in_bytes = part.at("size_in_bytes").get<int64_t>();
      p.etag = part.at("etag").get<std::string>();
      record.parts.push_back(std::move(p));
    }

    auto expires = parseTimestamp(doc.at("expires").get<std::string>());
    if (!expires) {
      return corrupt("invalid expires timestamp");
    }
    record.expires = *expires;

    // created_at is informational; older records may lack it
    auto created_at = parseTimestamp(doc.value("created_at", std::string()));
    record.created_at = created_at ? *created_at : record.expires;
  } catch (const nlohmann::json::exception& e) {
    return corrupt(std::string("malformed upload record: ") + e.what());
  }

  if (record.file_id.empty() || record.upload_id.empty()) {
    return corrupt("upload record without file_id or upload_id");
  }
  if (record.upload_length < kDeferredLength || record.upload_offset < 0) {
    return corrupt("negative upload offset or length");
  }

  int64_t committed = 0;
  for (size_t i = 0; i < record.parts.size(); ++i) {
    const auto& part = record.parts[i];
    if (part.number != static_cast<int>(i) + 1) {
      return corrupt("part numbers are not contiguous from 1");
    }
    if (part.size_in_bytes < 0 || part.etag.empty()) {
      return corrupt("part " + std::to_string(part.number) + " has no etag or a negative size");
    }
    committed += part.size_in_bytes;
  }
  if (committed != record.upload_offset) {
    return corrupt(
      "upload_offset " + std::to_string(record.upload_offset) + " differs from committed bytes " +
      std::to_string(committed)
    );
  }
  if (record.lengthKnown() && record.upload_offset > record.upload_length) {
    return corrupt("upload_offset exceeds upload_length");
  }

  return Result<UploadRecord>::Success(std::move(record));
}

}  // namespace store
}  // namespace stratus
