#pragma once
#include <string>

#include "application/ports/IConfigProvider.hpp"

namespace boost
{
namespace filesystem
{
class path;
}
}  // namespace boost

namespace strata::infrastructure::config
{

class Config_Toml : public strata::application::ports::IConfigProvider
{
 public:
  strata::domain::Settings load_or_create(const std::string& path) override;

  // TOML value for [decode] linkType: the quoted name, or the bare LINKTYPE
  // number when the type has no name.
  static std::string link_type_literal(strata::domain::LinkType t);

 private:
  static void write_default(const boost::filesystem::path& path, strata::domain::Settings& s);
};

}  // namespace strata::infrastructure::config
