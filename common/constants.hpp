/**
 * Copyright 2023 KUMAZAKI Hiroki
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#ifndef STRUCTSY_CONSTANTS_HPP
#define STRUCTSY_CONSTANTS_HPP

#include <cstddef>
#include <cstdint>
#include <limits>
#include <ostream>
#include <string>
#include <string_view>

#ifndef ERROR_CODES_DEFINE
#define ERROR_CODES_DEFINE
#define FATAL 9000
#define ERROR 5000
#define ALERT 4000
#define WARN 3000
#define NOTICE 2500
#define INFO 2000
#define USER 1500
#define DEBUG 1000
#define TRACE 0
#endif  // ERROR_CODE_DEFINE

namespace structsy {

static constexpr size_t kPageSize = 1024 * 32;
static constexpr size_t kPageTrailerSize = sizeof(uint64_t) +  // page_id
                                           sizeof(uint64_t) +  // page_lsn
                                           sizeof(uint64_t) +  // page_type
                                           sizeof(uint64_t);   // checksum
static constexpr size_t kPageBodySize = kPageSize - kPageTrailerSize;

#define RETURN_IF_FAIL(expr)                               \
  {                                                        \
    Status tmp_status = expr;                              \
    if (tmp_status != Status::kSuccess) return tmp_status; \
  }

enum class Status : uint8_t {
  kUnknown,
  kSuccess,
  kNoSpace,
  kDuplicates,
  kNotExists,
  kTooBigData,
  kInvalidArgument,
  kBackingStoreError,
  kIOError,
  kStructAlreadyDefined,
  kStructNotDefined,
  kMigrationNotSupported,
  kInvalidId,
  kLockPoisoned,
  kNeedsRecovery,
  kSortBufferExceeded,
  kTransactionClosed,
  kAborted,
};

enum class BinaryOperation : uint8_t {
  kEquals,
  kNotEquals,
  kLessThan,
  kLessThanEquals,
  kGreaterThan,
  kGreaterThanEquals,
};

typedef uint64_t lsn_t;
typedef uint64_t page_id_t;
typedef uint32_t type_id_t;
typedef uint32_t generation_t;
typedef uint16_t slot_t;
typedef uint16_t bin_size_t;

// Type id 0 holds the schema registry itself.
static constexpr type_id_t kSystemTypeId = 0;

static_assert(kPageSize <= std::numeric_limits<slot_t>::max());
static_assert(kPageSize <= std::numeric_limits<bin_size_t>::max());

inline std::string_view ToString(Status s) {
  switch (s) {
    case Status::kUnknown:
      return "Unknown";
    case Status::kSuccess:
      return "Success";
    case Status::kNoSpace:
      return "NoSpace";
    case Status::kDuplicates:
      return "Duplicates";
    case Status::kNotExists:
      return "NotExists";
    case Status::kTooBigData:
      return "TooBigData";
    case Status::kInvalidArgument:
      return "InvalidArgument";
    case Status::kBackingStoreError:
      return "BackingStoreError";
    case Status::kIOError:
      return "IOError";
    case Status::kStructAlreadyDefined:
      return "StructAlreadyDefined";
    case Status::kStructNotDefined:
      return "StructNotDefined";
    case Status::kMigrationNotSupported:
      return "MigrationNotSupported";
    case Status::kInvalidId:
      return "InvalidId";
    case Status::kLockPoisoned:
      return "LockPoisoned";
    case Status::kNeedsRecovery:
      return "NeedsRecovery";
    case Status::kSortBufferExceeded:
      return "SortBufferExceeded";
    case Status::kTransactionClosed:
      return "TransactionClosed";
    case Status::kAborted:
      return "Aborted";
    default:
      return "INVALID STATUS";
  }
}

inline std::ostream& operator<<(std::ostream& o, const Status s) {
  o << ToString(s);
  return o;
}

inline std::string_view ToString(BinaryOperation op) {
  switch (op) {
    case BinaryOperation::kEquals:
      return "==";
    case BinaryOperation::kNotEquals:
      return "!=";
    case BinaryOperation::kLessThan:
      return "<";
    case BinaryOperation::kLessThanEquals:
      return "<=";
    case BinaryOperation::kGreaterThan:
      return ">";
    case BinaryOperation::kGreaterThanEquals:
      return ">=";
  }
  return "?";
}

// Applies |op| to the result of a three-way comparison.
inline bool CompareResult(BinaryOperation op, int cmp) {
  switch (op) {
    case BinaryOperation::kEquals:
      return cmp == 0;
    case BinaryOperation::kNotEquals:
      return cmp != 0;
    case BinaryOperation::kLessThan:
      return cmp < 0;
    case BinaryOperation::kLessThanEquals:
      return cmp <= 0;
    case BinaryOperation::kGreaterThan:
      return 0 < cmp;
    case BinaryOperation::kGreaterThanEquals:
      return 0 <= cmp;
  }
  return false;
}

inline std::string Indent(size_t num) {
  return std::string(num, ' ');  // NOLINT
}

}  // namespace structsy

#endif  // STRUCTSY_CONSTANTS_HPP
