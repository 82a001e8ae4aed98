// SPDX-FileCopyrightText: 2002-2024 Rice University
// SPDX-FileCopyrightText: 2024 Contributors to the HPCToolkit Project
//
// SPDX-License-Identifier: BSD-3-Clause

#include "primitive.h"

#include <gtest/gtest.h>

TEST(PrimitiveTest, LittleEndian) {
  const char bytes[8] = {0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, (char)0x88};
  EXPECT_EQ(fmt_u16_read(bytes), 0x0201u);
  EXPECT_EQ(fmt_u32_read(bytes), 0x04030201u);
  EXPECT_EQ(fmt_u64_read(bytes), 0x8807060504030201ull);

  char out[8] = {0};
  fmt_u16_write(out, 0xBEEF);
  EXPECT_EQ(out[0], (char)0xEF);
  EXPECT_EQ(out[1], (char)0xBE);
  fmt_u32_write(out, 0x01020304u);
  EXPECT_EQ(out[0], 0x04);
  EXPECT_EQ(out[3], 0x01);
  fmt_u64_write(out, 0x1122334455667788ull);
  EXPECT_EQ(out[0], (char)0x88);
  EXPECT_EQ(out[7], 0x11);
}

TEST(PrimitiveTest, BigEndian) {
  const char bytes[8] = {0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, (char)0x88};
  EXPECT_EQ(fmt_u16_readbe(bytes), 0x0102u);
  EXPECT_EQ(fmt_u32_readbe(bytes), 0x01020304u);
  EXPECT_EQ(fmt_u64_readbe(bytes), 0x0102030405060788ull);

  // 1.5 in IEEE 754
  const char f32[4] = {0x3F, (char)0xC0, 0x00, 0x00};
  EXPECT_EQ(fmt_f32_readbe(f32), 1.5f);
  const char f64[8] = {0x3F, (char)0xF8, 0, 0, 0, 0, 0, 0};
  EXPECT_EQ(fmt_f64_readbe(f64), 1.5);
}
