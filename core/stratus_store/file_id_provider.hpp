// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef STRATUS_FILE_ID_PROVIDER_HPP
#define STRATUS_FILE_ID_PROVIDER_HPP

#include <memory>
#include <mutex>
#include <string>

#include <boost/uuid/random_generator.hpp>

namespace stratus {
namespace store {

/**
 * Strategy assigning FileIds to new uploads
 *
 * Ids become object key suffixes, so they must not contain '/'.
 */
class FileIdProvider {
public:
  virtual ~FileIdProvider() = default;

  /**
   * Create a new unique id
   *
   * @param metadata Opaque client metadata of the upload being created
   */
  virtual std::string createId(const std::string& metadata) = 0;

  /**
   * Check whether id could have been produced by createId()
   */
  virtual bool validateId(const std::string& id) const = 0;
};

/**
 * Random UUIDs rendered as 32 lowercase hex digits without dashes
 *
 * Thread-safe.
 */
class UuidFileIdProvider : public FileIdProvider {
public:
  std::string createId(const std::string& metadata) override;
  bool validateId(const std::string& id) const override;

private:
  std::mutex mutex_;
  boost::uuids::random_generator generator_;
};

}  // namespace store
}  // namespace stratus

#endif  // STRATUS_FILE_ID_PROVIDER_HPP
