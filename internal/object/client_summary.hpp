#pragma once

#include "aff4/store/v1/client.pb.h"
#include "object.hpp"

namespace aff4::object {

/*
  Builds a ClientSummary from the attributes visible on a client handle.

  The summary timestamp is the newest stored version among the consulted
  attributes. Values staged on the handle but not yet flushed count as
  written now. With nothing set the handle's open time is used.
*/
v1::ClientSummary SummarizeClient(const Object& client);

} // namespace aff4::object
