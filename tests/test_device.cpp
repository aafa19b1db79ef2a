#include "minitest.hpp"
#include "fakes.hpp"
#include "core/device.hpp"

using namespace ntfsmh;

TEST(device_resolves_uuid_and_label) {
  FakeRunner r;
  r.on("blkid -U ABCD", 0, "/dev/sdb1\n");
  r.on("blkid -L Media", 0, "/dev/sdc2\n");
  ASSERT_EQ(resolve_device(r, "UUID=ABCD"), std::string("/dev/sdb1"));
  ASSERT_EQ(resolve_device(r, "LABEL=Media"), std::string("/dev/sdc2"));
}

TEST(device_resolves_partuuid_through_token_lookup) {
  FakeRunner r;
  r.on("blkid -o device -t PARTUUID=0a1b-02", 0, "/dev/nvme0n1p2\n");
  ASSERT_EQ(resolve_device(r, "PARTUUID=0a1b-02"), std::string("/dev/nvme0n1p2"));
}

TEST(device_resolution_falls_back_to_spec) {
  FakeRunner r;
  r.on("blkid -U DEAD", 2);
  r.on("blkid -L Empty", 0, "\n");
  ASSERT_EQ(resolve_device(r, "UUID=DEAD"), std::string("UUID=DEAD"));
  ASSERT_EQ(resolve_device(r, "LABEL=Empty"), std::string("LABEL=Empty"));
}

TEST(device_plain_path_is_not_looked_up) {
  FakeRunner r;
  ASSERT_EQ(resolve_device(r, "/dev/sdd1"), std::string("/dev/sdd1"));
  ASSERT_TRUE(r.calls.empty());
}

TEST(device_type_detection) {
  FakeRunner r;
  r.on("blkid -s TYPE -o value /dev/sdb1", 0, "ntfs\n");
  r.on("blkid -s TYPE -o value /dev/sdb2", 2);
  ASSERT_EQ(detect_fs_type(r, "/dev/sdb1"), std::string("ntfs"));
  ASSERT_EQ(detect_fs_type(r, "/dev/sdb2"), std::string(""));
}

TEST(device_ntfs_type_variants) {
  ASSERT_TRUE(is_ntfs_type("ntfs"));
  ASSERT_TRUE(is_ntfs_type("ntfs3"));
  ASSERT_TRUE(is_ntfs_type("ntfs-3g"));
  ASSERT_FALSE(is_ntfs_type("exfat"));
  ASSERT_FALSE(is_ntfs_type(""));
}

TEST(device_block_and_mount_probes) {
  FakeRunner r;
  r.on("test -b /dev/sdb1", 0);
  r.on("mountpoint -q /mnt/data", 0);
  ASSERT_TRUE(is_block_device(r, "/dev/sdb1"));
  ASSERT_FALSE(is_block_device(r, "/dev/sdx9"));
  ASSERT_TRUE(is_mounted(r, "/mnt/data"));
  ASSERT_FALSE(is_mounted(r, "/mnt/other"));
  ASSERT_EQ(device_base_name("/dev/sdb1"), std::string("sdb1"));
}
