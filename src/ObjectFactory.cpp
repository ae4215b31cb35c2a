#include <Trellis/ObjectFactory.hpp>
#include <Trellis/TypeBuilder.hpp>

#include <map>
#include <string>

namespace Trellis
{

  namespace
  {
    // Concrete type to instantiate for an abstract request
    Type ResolveInterface(const Type &type)
    {
      if (type == GetType<Any>())
        return GetType<std::map<std::string, Any>>();
      return type;
    }
  } // namespace

  std::expected<Any, Error> DefaultObjectFactory::Create(const Type &type, std::span<const Type> argTypes,
                                                         std::span<const Any> args)
  {
    if (!type.IsValid())
      return std::unexpected(Error{ErrorCode::InvalidArgument, "invalid type"});
    if (argTypes.size() != args.size())
      return std::unexpected(Error{ErrorCode::InvalidArgument, "argument types and values differ in count"});

    const auto target = ResolveInterface(type);
    if (args.empty())
      return target.DefaultConstruct();

    // Match the requested signature exactly when one is registered
    for (NGIN::UIntSize i = 0; i < target.ConstructorCount(); ++i)
    {
      const auto ctor = target.ConstructorAt(i);
      if (ctor.ParameterCount() != argTypes.size())
        continue;
      bool match = true;
      for (NGIN::UIntSize k = 0; k < argTypes.size() && match; ++k)
        match = ctor.ParameterTypeId(k) == argTypes[k].GetTypeId();
      if (match)
        return ctor.Construct(args);
    }
    return target.Construct(args);
  }

  bool DefaultObjectFactory::IsCollection(const Type &type) const
  {
    return type.IsValid() && type.GetShape() == Shape::Sequence;
  }

} // namespace Trellis
