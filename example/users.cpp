#include <iostream>
#include <string>
#include <vector>

#include "errors.hpp"
#include "tables.hpp"

struct User {
  std::string name;
  unsigned age;
};

mdtable::Row to_row(const User &user) {
  return mdtable::Row{user.name, std::to_string(user.age)};
}

int main() {
  std::vector<User> users{{"Jessica", 28}, {"Dennis", 22}};
  try {
    mdtable::Table table({"Name", "Age"}, std::vector<mdtable::Row>{});
    for (const auto &user : users) {
      table.add_row(user);
    }
    std::cout << table;
  } catch (const mdtable::Error &e) {
    std::cerr << "[ERROR] " << e.what() << std::endl;
    return 1;
  }
  return 0;
}
