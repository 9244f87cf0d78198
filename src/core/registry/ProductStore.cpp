#include "ProductStore.hpp"

#include "Database.hpp"

namespace pcr {

ProductStore::ProductStore(Connection& conn) : conn_(conn) {}

bool ProductStore::exists(const std::string& id) const {
  Statement st(conn_, "SELECT 1 FROM products WHERE id = ?");
  st.bindText(1, id);
  return st.step();
}

std::optional<Product> ProductStore::get(const std::string& id) const {
  const char* sql = R"SQL(
    SELECT id, current_owner, registration_timestamp, is_genuine, status, details_uri
    FROM products WHERE id = ?
  )SQL";
  Statement st(conn_, sql);
  st.bindText(1, id);
  if (!st.step()) return std::nullopt;

  Product p;
  p.id                     = st.columnText(0);
  p.current_owner          = st.columnText(1);
  p.registration_timestamp = st.columnInt64(2);
  p.is_genuine             = st.columnInt64(3) != 0;
  p.status                 = st.columnText(4);
  p.details_uri            = st.columnText(5);
  return p;
}

Status ProductStore::insert(const std::string& id, const Product& product) {
  if (exists(id)) {
    return Status::failure(ErrorKind::DuplicateId, "product already registered: " + id);
  }
  const char* sql = R"SQL(
    INSERT INTO products
      (id, current_owner, registration_timestamp, is_genuine, status, details_uri)
    VALUES (?,?,?,?,?,?)
  )SQL";
  Statement st(conn_, sql);
  int i=1;
  st.bindText(i++, id);
  st.bindText(i++, product.current_owner);
  st.bindInt64(i++, product.registration_timestamp);
  st.bindInt64(i++, product.is_genuine ? 1 : 0);
  st.bindText(i++, product.status);
  st.bindText(i++, product.details_uri);
  st.step();
  return Status::success();
}

Status ProductStore::update(const std::string& id, const std::string& status, const Identity& newOwner) {
  Statement st(conn_, "UPDATE products SET status = ?, current_owner = ? WHERE id = ?");
  st.bindText(1, status).bindText(2, newOwner).bindText(3, id);
  st.step();
  if (conn_.changes() == 0) {
    return Status::failure(ErrorKind::NotFound, "no such product: " + id);
  }
  return Status::success();
}

std::size_t ProductStore::count() const {
  Statement st(conn_, "SELECT COUNT(*) FROM products");
  return st.step() ? static_cast<std::size_t>(st.columnInt64(0)) : 0;
}

} // namespace pcr
