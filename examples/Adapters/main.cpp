#include <Trellis/Trellis.hpp>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

int main()
{
  using namespace Trellis;

  std::vector<int> v{1, 2, 3};
  auto seq = ObjectRef::Of(v);
  std::cout << "std::vector size=" << (unsigned)seq.Size() << ", elem1=" << seq.Element("1")->Load().Cast<int>() << "\n";

  NGIN::Containers::Vector<int> nv;
  nv.PushBack(4);
  nv.PushBack(5);
  auto nvRef = ObjectRef::Of(nv);
  (void)nvRef.Append(Any{6});
  std::cout << "NGIN::Vector size=" << (unsigned)nvRef.Size() << ", elem2=" << nvRef.Element("2")->Load().Cast<int>() << "\n";

  std::map<std::string, std::string> m{{"one", "1"}};
  auto mapRef = ObjectRef::Of(m);
  (void)mapRef.StoreElement("two", Any{std::string{"2"}});
  std::cout << "map keys:";
  auto keys = mapRef.Keys();
  for (NGIN::UIntSize i = 0; i < keys.Size(); ++i)
    std::cout << " " << keys[i];
  std::cout << "\n";

  std::optional<int> o{7};
  auto target = ObjectRef::Of(o).Deref();
  std::cout << "optional holds " << target.ValueType().QualifiedName() << " = " << target.Load().Cast<int>() << "\n";

  // The same containers through path navigation
  auto meta = SystemMetaObject::ForObject(m);
  std::cout << "map path two=" << meta->GetValueAs<std::string>("two").value_or("?") << "\n";
  return 0;
}
