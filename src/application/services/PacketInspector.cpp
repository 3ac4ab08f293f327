#include "application/services/PacketInspector.hpp"

#include <sstream>

#include "shared/hex/Hex.hpp"

using strata::application::ports::LogLevel;

namespace strata::application::services
{

decode::Packet PacketInspector::make_packet(std::span<const std::byte> data) const
{
  return decode::Packet(data, cfg_.decode.linkType, cfg_.decode.mode, registry_,
                        decode::PacketOptions{cfg_.decode.maxSteps});
}

InspectionReport PacketInspector::inspect(std::span<const std::byte> data)
{
  return inspect(data, cfg_.decode.linkType);
}

InspectionReport PacketInspector::inspect(std::span<const std::byte> data,
                                          domain::LinkType link_type)
{
  const decode::Packet pkt(data, link_type, cfg_.decode.mode, registry_,
                           decode::PacketOptions{cfg_.decode.maxSteps});
  return inspect(pkt);
}

InspectionReport PacketInspector::inspect(const decode::Packet& pkt)
{
  const uint64_t id = ++packets_;

  InspectionReport report;
  report.bytes = pkt.data().size();

  const auto& chain = pkt.layers();
  std::ostringstream names;
  for (std::size_t i = 0; i < chain.size(); ++i)
  {
    const auto& layer = *chain[i];
    report.layers.push_back(to_string(layer.type()));
    if (i) names << ", ";
    names << report.layers.back();

    log_.decode(LogLevel::debug,
                "#" + std::to_string(id) + " " +
                    shared::hex::make_line(report.layers.back(), layer.payload(),
                                           cfg_.decode.hexDumpBytes));
  }

  if (const auto* app = pkt.application_layer()) report.applicationBytes = app->payload().size();

  std::ostringstream summary;
  summary << "#" << id << " " << report.bytes << " bytes, " << to_string(pkt.link_type()) << " ["
          << names.str() << "]";

  if (const auto* err = pkt.error_layer())
  {
    report.failure = err->error().cause;
    summary << " decode failed after " << (chain.size() - 1) << " layer(s): " << *report.failure;
    log_.decode(LogLevel::warn, summary.str());
  }
  else
  {
    log_.decode(LogLevel::info, summary.str());
  }

  return report;
}

}  // namespace strata::application::services
