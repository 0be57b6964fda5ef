#pragma once

#include <memory>

namespace px::oracle {
class BufferOracle;
class DiskOracle;
class ContentClassifier;
class BinaryExtractor;
}

namespace px::context {

// Everything the engine reads the outside world through. The buffer oracle is
// optional; without it text files are always read from disk.
struct Deps {
    std::shared_ptr<oracle::BufferOracle> buffers;
    std::shared_ptr<oracle::DiskOracle> disk;
    std::shared_ptr<oracle::ContentClassifier> classifier;
    std::shared_ptr<oracle::BinaryExtractor> extractor;

    // LocalDisk, MagicClassifier and PdfiumExtractor, with no editor attached.
    static Deps local();
};

}
