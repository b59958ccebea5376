#pragma once

#include <grpcpp/grpcpp.h>

#include <string_view>

#include "internal/util/errors.hpp"

namespace chunkcam::grpc {

/*
  Converts gRPC status codes into upload errors.

  Codes that describe the request itself (bad argument, rejected auth,
  conflicting object) are permanent; everything else is worth retrying.
*/

bool IsRetryable(::grpc::StatusCode code);

util::UploadError ToUploadError(const ::grpc::Status& status, std::string_view action);

} // namespace chunkcam::grpc
