#include "context/Deps.hpp"
#include "oracle/DiskOracle.hpp"
#include "oracle/ContentClassifier.hpp"
#include "oracle/BinaryExtractor.hpp"

using namespace px::context;

Deps Deps::local() {
    return Deps{
        .buffers = nullptr,
        .disk = std::make_shared<oracle::LocalDisk>(),
        .classifier = std::make_shared<oracle::MagicClassifier>(),
        .extractor = std::make_shared<oracle::PdfiumExtractor>()
    };
}
