#include <Trellis/Trellis.hpp>

#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Demo {
  struct Address {
    std::string city;
    friend void TrellisReflect(Trellis::Tag<Address>, Trellis::TypeBuilder<Address> &b) {
      b.SetName("Demo::Address");
      b.Field<&Address::city>("city");
    }
  };

  // Entity<ID>: a generic base whose id type is chosen by subclasses
  struct Entity {
    Trellis::Any id;
    friend void TrellisReflect(Trellis::Tag<Entity>, Trellis::TypeBuilder<Entity> &b) {
      b.SetName("Demo::Entity");
      b.TypeParameter("ID");
      b.Field<&Entity::id>("id", b.Var("ID"));
    }
  };

  struct User : Entity {
    std::string name;
    std::shared_ptr<Address> address;
    std::map<std::string, Trellis::Any> settings;
    friend void TrellisReflect(Trellis::Tag<User>, Trellis::TypeBuilder<User> &b) {
      b.SetName("Demo::User");
      b.Base<Entity>({Trellis::ClassOf<long>()});
      b.Field<&User::name>("name");
      b.Field<&User::address>("address");
      b.Field<&User::settings>("settings");
    }
  };

  class Greeting : public Trellis::TokenHandler {
  public:
    explicit Greeting(Trellis::MetaObject &meta) : m_meta(meta) {}
    std::string HandleToken(std::string_view expression) override {
      return m_meta.GetValueAs<std::string>(expression).value_or("<unset>");
    }

  private:
    Trellis::MetaObject &m_meta;
  };
}

int main() {
  using namespace Trellis;
  std::cout << "Library: " << LibraryName() << "\n";

  // Resolve the inherited generic member against the concrete subclass
  auto id = GetType<Demo::Entity>().GetField("id").value();
  std::cout << "Entity.id as seen from User: " << ResolveFieldType(id, ClassOf<Demo::User>())->ToString() << "\n";

  Demo::User user{};
  user.name = "Ada";
  auto meta = SystemMetaObject::ForObject(user);

  // Intermediate objects are created on demand
  if (auto r = meta->SetValue("address.city", Any{std::string{"Oslo"}}); !r)
    std::cout << "set failed: " << r.error().message << "\n";
  if (auto r = meta->SetValue("settings.theme", Any{std::string{"dark"}}); !r)
    std::cout << "set failed: " << r.error().message << "\n";
  if (auto r = meta->SetValue("id", Any{42L}); !r)
    std::cout << "set failed: " << r.error().message << "\n";

  std::cout << "address.city = " << meta->GetValueAs<std::string>("address.city").value_or("?") << "\n";
  std::cout << "id type = " << meta->GetGetterType("id")->QualifiedName() << "\n";
  std::cout << "canonical path for ADDRESS.CITY: " << meta->FindProperty("ADDRESS.CITY").value_or("?") << "\n";

  Demo::Greeting handler{*meta};
  GenericTokenParser parser{"${", "}", handler};
  std::cout << parser.Parse("Hello ${name} from ${address.city}, theme ${settings.theme}") << "\n";
  return 0;
}
