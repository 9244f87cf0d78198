#include "TestSupport.hpp"

#include "core/registry/ProductStore.hpp"

using namespace pcr;
using namespace pcr::test;

namespace {

Product sample(const std::string& id) {
  Product p;
  p.id = id;
  p.current_owner = kManufacturer;
  p.registration_timestamp = kT0;
  p.status = kInitialStatus;
  p.details_uri = "ipfs://x";
  return p;
}

} // namespace

class ProductStoreTest : public DbTest {};

TEST_F(ProductStoreTest, InsertThenGetReturnsFullSnapshot) {
  ProductStore store(db().writer());
  ASSERT_TRUE(store.insert("SN-001", sample("SN-001")).ok());

  EXPECT_TRUE(store.exists("SN-001"));
  auto p = store.get("SN-001");
  ASSERT_TRUE(p.has_value());
  EXPECT_EQ(p->id, "SN-001");
  EXPECT_EQ(p->current_owner, kManufacturer);
  EXPECT_EQ(p->registration_timestamp, kT0);
  EXPECT_TRUE(p->is_genuine);
  EXPECT_EQ(p->status, "Registered at Manufacturing");
  EXPECT_EQ(p->details_uri, "ipfs://x");
}

TEST_F(ProductStoreTest, MissingIdIsAbsent) {
  ProductStore store(db().writer());
  EXPECT_FALSE(store.exists("nope"));
  EXPECT_FALSE(store.get("nope").has_value());
  EXPECT_EQ(store.count(), 0u);
}

TEST_F(ProductStoreTest, SecondInsertOfSameIdFailsDuplicateAndKeepsFirst) {
  ProductStore store(db().writer());
  ASSERT_TRUE(store.insert("SN-001", sample("SN-001")).ok());

  Product other = sample("SN-001");
  other.details_uri = "ipfs://other";
  Status st = store.insert("SN-001", other);
  EXPECT_EQ(st.kind, ErrorKind::DuplicateId);
  EXPECT_EQ(store.get("SN-001")->details_uri, "ipfs://x");
  EXPECT_EQ(store.count(), 1u);
}

TEST_F(ProductStoreTest, UpdateReplacesOnlyStatusAndOwner) {
  ProductStore store(db().writer());
  ASSERT_TRUE(store.insert("SN-001", sample("SN-001")).ok());

  ASSERT_TRUE(store.update("SN-001", "Shipped", kDistributor).ok());
  auto p = store.get("SN-001");
  EXPECT_EQ(p->status, "Shipped");
  EXPECT_EQ(p->current_owner, kDistributor);
  EXPECT_EQ(p->registration_timestamp, kT0);
  EXPECT_EQ(p->details_uri, "ipfs://x");
  EXPECT_TRUE(p->is_genuine);
}

TEST_F(ProductStoreTest, UpdateOfUnknownIdFailsNotFound) {
  ProductStore store(db().writer());
  EXPECT_EQ(store.update("ghost", "Shipped", kDistributor).kind, ErrorKind::NotFound);
  EXPECT_EQ(store.count(), 0u);
}

TEST_F(ProductStoreTest, RolledBackInsertIsNeverVisible) {
  ProductStore writer(db().writer());
  ProductStore reader(db().reader());
  {
    Transaction tx(db());
    ASSERT_TRUE(writer.insert("SN-001", sample("SN-001")).ok());
    EXPECT_FALSE(reader.exists("SN-001"));
  }
  EXPECT_FALSE(writer.exists("SN-001"));
  EXPECT_FALSE(reader.exists("SN-001"));
}

TEST_F(ProductStoreTest, ReaderSeesCommittedSnapshot) {
  ProductStore writer(db().writer());
  ProductStore reader(db().reader());
  {
    Transaction tx(db());
    ASSERT_TRUE(writer.insert("SN-001", sample("SN-001")).ok());
    tx.commit();
  }
  EXPECT_TRUE(reader.exists("SN-001"));
}

TEST_F(ProductStoreTest, DatabaseRejectsDeletingProducts) {
  ProductStore store(db().writer());
  ASSERT_TRUE(store.insert("SN-001", sample("SN-001")).ok());
  EXPECT_THROW(db().writer().exec("DELETE FROM products WHERE id = 'SN-001'"), std::runtime_error);
  EXPECT_TRUE(store.exists("SN-001"));
}

TEST_F(ProductStoreTest, SchemaVersionIsRecorded) {
  EXPECT_EQ(db().schemaVersion(), kSchemaVersion);
}

TEST_F(ProductStoreTest, IdsWithEmbeddedNulStayDistinct) {
  ProductStore store(db().writer());
  const std::string a("SN\0A", 4);
  const std::string b("SN\0B", 4);
  ASSERT_TRUE(store.insert(a, sample(a)).ok());
  ASSERT_TRUE(store.insert(b, sample(b)).ok());

  EXPECT_EQ(store.count(), 2u);
  EXPECT_FALSE(store.exists("SN"));
  auto p = store.get(b);
  ASSERT_TRUE(p.has_value());
  EXPECT_EQ(p->id, b);
  EXPECT_EQ(p->id.size(), 4u);
}
