#pragma once
#include <cstddef>
#include <optional>
#include <string>

#include "Types.hpp"

namespace pcr {

class Connection;

// Maps product id to its current snapshot. The store owns every record;
// get() hands out copies. Run mutations inside a Transaction.
class ProductStore {
public:
  explicit ProductStore(Connection& conn);

  bool exists(const std::string& id) const;
  std::optional<Product> get(const std::string& id) const;

  // DuplicateId if the id is already present.
  Status insert(const std::string& id, const Product& product);

  // Replaces status and owner in one statement; NotFound if absent.
  Status update(const std::string& id, const std::string& status, const Identity& newOwner);

  std::size_t count() const;

private:
  Connection& conn_;
};

} // namespace pcr
