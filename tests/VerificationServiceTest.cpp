#include "TestSupport.hpp"

#include "core/registry/ProductStore.hpp"
#include "core/registry/VerificationService.hpp"

using namespace pcr;
using namespace pcr::test;

class VerificationServiceTest : public DbTest {};

TEST_F(VerificationServiceTest, ReturnsLatestSnapshotFields) {
  ProductStore writer(db().writer());
  Product p;
  p.id = "SN-001";
  p.current_owner = kDistributor;
  p.registration_timestamp = kT0;
  p.status = "Shipped";
  p.details_uri = "ipfs://x";
  ASSERT_TRUE(writer.insert("SN-001", p).ok());

  ProductStore reader(db().reader());
  VerificationService service(reader);
  auto out = service.verify("SN-001");
  ASSERT_TRUE(out.ok());
  EXPECT_TRUE(out->is_genuine);
  EXPECT_EQ(out->status, "Shipped");
  EXPECT_EQ(out->current_owner, kDistributor);
  EXPECT_EQ(out->details_uri, "ipfs://x");
  EXPECT_EQ(out->registration_timestamp, kT0);
}

TEST_F(VerificationServiceTest, UnregisteredIdIsNotFound) {
  ProductStore reader(db().reader());
  VerificationService service(reader);
  EXPECT_EQ(service.verify("SN-404").error(), ErrorKind::NotFound);
  EXPECT_EQ(service.verify("").error(), ErrorKind::NotFound);
}
