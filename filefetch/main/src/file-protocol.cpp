#include "filefetch/file-protocol.hpp"

#include <memory>
#include <string_view>
#include <utility>

#include "filefetch/file-protocol-config.hpp"
#include "filefetch/file-response.hpp"
#include "filefetch/filesystem-probe.hpp"
#include "filefetch/log.hpp"
#include "filefetch/metadata.hpp"
#include "filefetch/protocol-response.hpp"

namespace filefetch {

FileProtocol::FileProtocol(FileProtocolConfig config, std::shared_ptr<const FileSystemProbe> probe)
    : _config(std::move(config)), _probe(std::move(probe)) {
  _config.validate();
  log::debug("File protocol configured with character encoding '{}', crawl parent {}", _config.characterEncoding(),
             _config.crawlParent);
}

ProtocolResponse FileProtocol::getProtocolOutput(std::string_view locator, Metadata& metadata) const {
  return FileResponse(locator, metadata, _config, probe()).toProtocolResponse();
}

}  // namespace filefetch
