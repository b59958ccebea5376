#pragma once

#include "internal/model/chunk.hpp"

namespace chunkcam::recorder {

// Receives every finalized chunk. Implemented by the upload queue.
class ChunkSink {
 public:
  virtual ~ChunkSink() = default;

  virtual void Enqueue(const model::Chunk& chunk) = 0;
};

// Optional copy of each chunk into a user-visible library. Best-effort.
class GalleryExporter {
 public:
  virtual ~GalleryExporter() = default;

  virtual void Export(const model::Chunk& chunk) = 0;
};

} // namespace chunkcam::recorder
