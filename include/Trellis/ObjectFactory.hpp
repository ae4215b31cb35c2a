// ObjectFactory.hpp
// Creates instances of registered types for the navigator
#pragma once

#include <expected>
#include <span>

#include <Trellis/Export.hpp>
#include <Trellis/Types.hpp>
#include <Trellis/Registry.hpp>

namespace Trellis
{

  class TRELLIS_API ObjectFactory
  {
  public:
    virtual ~ObjectFactory() = default;

    // argTypes names the constructor signature; args are converted to it
    [[nodiscard]] virtual std::expected<Any, Error> Create(const Type &type, std::span<const Type> argTypes,
                                                           std::span<const Any> args) = 0;
    [[nodiscard]] virtual bool IsCollection(const Type &type) const = 0;

    [[nodiscard]] std::expected<Any, Error> Create(const Type &type) { return Create(type, {}, {}); }
  };

  // Default-constructs or uses a registered constructor. A request for the top
  // type yields an empty std::map<std::string, Any>.
  class TRELLIS_API DefaultObjectFactory : public ObjectFactory
  {
  public:
    using ObjectFactory::Create;

    [[nodiscard]] std::expected<Any, Error> Create(const Type &type, std::span<const Type> argTypes,
                                                   std::span<const Any> args) override;
    [[nodiscard]] bool IsCollection(const Type &type) const override;
  };

} // namespace Trellis
