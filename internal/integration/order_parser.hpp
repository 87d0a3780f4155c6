#pragma once

#include <string>
#include <string_view>

#include "resync/v1/types.pb.h"

namespace resync::integration {

/*
  Delivery-platform webhook parser.

  Turns a platform's raw order body into a check for the given property.
  Throws util::InvalidArgument on a body it cannot read.
*/
class OrderParser {
 public:
  virtual ~OrderParser() = default;

  virtual std::string_view Type() const = 0;

  virtual resync::v1::Check ParseOrder(const std::string& property_id, const std::string& body) = 0;
};

} // namespace resync::integration
