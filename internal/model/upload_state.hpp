#pragma once

#include "chunkcam/v1/queue.pb.h"

namespace chunkcam::model {

using chunkcam::v1::UploadStatus;

/*
  Per-item state machine:

    pending -> uploading -> completed
                         -> pending   (retry scheduled)
                         -> failed    (retries exhausted / non-retryable)
    failed  -> pending                (manual retry)

  uploading is only ever entered by the queue itself.
*/
constexpr bool CanTransition(UploadStatus from, UploadStatus to) {
  using chunkcam::v1::UPLOAD_STATUS_COMPLETED;
  using chunkcam::v1::UPLOAD_STATUS_FAILED;
  using chunkcam::v1::UPLOAD_STATUS_PENDING;
  using chunkcam::v1::UPLOAD_STATUS_UPLOADING;

  switch (from) {
    case UPLOAD_STATUS_PENDING:
      return to == UPLOAD_STATUS_UPLOADING;
    case UPLOAD_STATUS_UPLOADING:
      return to == UPLOAD_STATUS_COMPLETED || to == UPLOAD_STATUS_PENDING || to == UPLOAD_STATUS_FAILED;
    case UPLOAD_STATUS_FAILED:
      return to == UPLOAD_STATUS_PENDING;
    default:
      return false;
  }
}

constexpr bool IsTerminal(UploadStatus status) {
  return status == chunkcam::v1::UPLOAD_STATUS_COMPLETED || status == chunkcam::v1::UPLOAD_STATUS_FAILED;
}

const char* StatusName(UploadStatus status);

} // namespace chunkcam::model
