#include <cstdint>
#include <initializer_list>
#include <vector>

#include <doctest/doctest.h>

#include "chip8vm/chip8.hpp"

using namespace Chip8Vm;

/* ------------------------------------------------------------------------- */
/* Helpers                                                                   */
/* ------------------------------------------------------------------------- */
static void LoadRom (Chip8 & vm, std::initializer_list<uint8_t> bytes)
{
  std::vector<uint8_t> rom(bytes);
  REQUIRE(vm.LoadProgram(rom.data(), rom.size()));
}

/* ------------------------------------------------------------------------- */
/* WaitForKey                                                                */
/* ------------------------------------------------------------------------- */
TEST_CASE("WaitForKey blocks until a key is released")
{
  Chip8 vm;
  LoadRom(vm, {
    0xF3, 0x0A, // LD V3, K
    0x61, 0x01, // LD V1, 1
  });

  bool executed = false;
  REQUIRE(vm.EmulateCycle(&executed).Ok());
  CHECK(executed);
  CHECK(vm.m_mode == Mode(ModeKind::WaitForKey, 3));
  CHECK(vm.m_pc == 0x202);

  // nothing runs while waiting, and pressing alone is not enough
  vm.KeyDown(0x7);
  REQUIRE(vm.EmulateCycle(&executed).Ok());
  CHECK_FALSE(executed);
  CHECK(vm.m_v[1] == 0);
  CHECK(vm.m_mode.kind == ModeKind::WaitForKey);

  vm.KeyUp(0x7);
  CHECK(vm.m_v[3] == 7);
  CHECK(vm.m_mode == Mode(ModeKind::Running));
  CHECK_FALSE(vm.m_keyboard.IsDown(0x7));

  REQUIRE(vm.EmulateCycle(&executed).Ok());
  CHECK(executed);
  CHECK(vm.m_v[1] == 1);
}

TEST_CASE("key releases outside WaitForKey do not touch registers")
{
  Chip8 vm;
  vm.KeyDown(0x4);
  vm.KeyUp(0x4);

  for (unsigned reg = 0; reg < Chip8::s_registerCount; ++reg)
    CHECK(vm.m_v[reg] == 0);
  CHECK(vm.m_mode == Mode(ModeKind::Running));
}

TEST_CASE("releasing an out-of-range key does not end the wait")
{
  Chip8 vm;
  vm.m_mode = Mode(ModeKind::WaitForKey, 2);

  vm.KeyUp(0x10);

  CHECK(vm.m_mode == Mode(ModeKind::WaitForKey, 2));
  CHECK(vm.m_v[2] == 0);
}

/* ------------------------------------------------------------------------- */
/* Pause and single step                                                     */
/* ------------------------------------------------------------------------- */
TEST_CASE("a paused machine runs exactly one cycle per step request")
{
  Chip8 vm;
  LoadRom(vm, {0x71, 0x01, 0x71, 0x01, 0x71, 0x01});

  CHECK(vm.SetPaused(true));
  CHECK(vm.m_mode == Mode(ModeKind::Paused));

  bool executed = true;
  REQUIRE(vm.EmulateCycle(&executed).Ok());
  CHECK_FALSE(executed);
  CHECK(vm.m_v[1] == 0);

  CHECK(vm.RequestStep());
  REQUIRE(vm.EmulateCycle(&executed).Ok());
  CHECK(executed);
  CHECK(vm.m_v[1] == 1);
  CHECK(vm.m_mode == Mode(ModeKind::Paused));

  REQUIRE(vm.EmulateCycle(&executed).Ok());
  CHECK_FALSE(executed);
  CHECK(vm.m_v[1] == 1);

  CHECK(vm.SetPaused(false));
  REQUIRE(vm.EmulateCycle(&executed).Ok());
  CHECK(executed);
  CHECK(vm.m_v[1] == 2);
}

TEST_CASE("step requests are only accepted while paused")
{
  Chip8 vm;
  CHECK_FALSE(vm.RequestStep());

  vm.m_mode = Mode(ModeKind::WaitForKey, 0);
  CHECK_FALSE(vm.RequestStep());
  CHECK_FALSE(vm.SetPaused(true));
  CHECK(vm.m_mode.kind == ModeKind::WaitForKey);
}

TEST_CASE("unpausing drops a pending step request")
{
  Chip8 vm;
  LoadRom(vm, {0x71, 0x01, 0x71, 0x01});

  vm.SetPaused(true);
  vm.RequestStep();
  vm.SetPaused(false);
  vm.SetPaused(true);

  bool executed = true;
  REQUIRE(vm.EmulateCycle(&executed).Ok());
  CHECK_FALSE(executed);
}

TEST_CASE("a wait entered by a paused step returns to Paused")
{
  Chip8 vm;
  LoadRom(vm, {0xF5, 0x0A, 0x61, 0x01});

  vm.SetPaused(true);
  vm.RequestStep();
  REQUIRE(vm.EmulateCycle().Ok());
  CHECK(vm.m_mode == Mode(ModeKind::WaitForKey, 5));

  vm.KeyDown(0xB);
  vm.KeyUp(0xB);
  CHECK(vm.m_v[5] == 0xB);
  CHECK(vm.m_mode == Mode(ModeKind::Paused));

  bool executed = true;
  REQUIRE(vm.EmulateCycle(&executed).Ok());
  CHECK_FALSE(executed);
}
