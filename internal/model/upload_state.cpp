#include "upload_state.hpp"

namespace chunkcam::model {

const char* StatusName(UploadStatus status) {
  switch (status) {
    case chunkcam::v1::UPLOAD_STATUS_PENDING:
      return "pending";
    case chunkcam::v1::UPLOAD_STATUS_UPLOADING:
      return "uploading";
    case chunkcam::v1::UPLOAD_STATUS_COMPLETED:
      return "completed";
    case chunkcam::v1::UPLOAD_STATUS_FAILED:
      return "failed";
    default:
      return "unspecified";
  }
}

} // namespace chunkcam::model
