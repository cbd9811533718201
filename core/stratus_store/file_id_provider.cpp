// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "file_id_provider.hpp"

#include <boost/lexical_cast.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <algorithm>

namespace stratus {
namespace store {

namespace {

constexpr size_t kIdLength = 32;

}  // namespace

std::string UuidFileIdProvider::createId(const std::string& /*metadata*/) {
  boost::uuids::uuid id;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    id = generator_();
  }

  // Canonical form is 8-4-4-4-12 lowercase hex; keys use it without dashes
  std::string text = boost::lexical_cast<std::string>(id);
  text.erase(std::remove(text.begin(), text.end(), '-'), text.end());
  return text;
}

bool UuidFileIdProvider::validateId(const std::string& id) const {
  if (id.size() != kIdLength) {
    return false;
  }
  for (char c : id) {
    bool hex = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
    if (!hex) {
      return false;
    }
  }
  return true;
}

}  // namespace store
}  // namespace stratus
