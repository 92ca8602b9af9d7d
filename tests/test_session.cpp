#include <atomic>
#include <cstdint>
#include <thread>
#include <vector>

#include <doctest/doctest.h>

#include "chip8vm/session.hpp"

using namespace Chip8Vm;

TEST_CASE("CopyDisplay hands out the redraw flag once")
{
  Session session;
  const uint8_t rom[] = {
    0xA0, 0x05, // LD I, 5   (glyph 1)
    0xD0, 0x05, // DRW V0, V0, 5
  };
  REQUIRE(session.LoadProgram(rom, sizeof(rom)));

  std::vector<uint8_t> vram(Chip8::s_renderWidth * Chip8::s_renderHeight, 0xFF);
  CHECK_FALSE(session.CopyDisplay(vram.data()));
  CHECK(vram[0] == 0);

  REQUIRE(session.EmulateCycle().Ok());
  REQUIRE(session.EmulateCycle().Ok());

  CHECK(session.CopyDisplay(vram.data()));
  CHECK(vram[2] == 1); // top row of "1" is 0x20
  CHECK(vram[0] == 0);
  CHECK_FALSE(session.CopyDisplay(vram.data()));
  CHECK(session.GetSnapshot().drawFlag == false);
}

TEST_CASE("session forwards control requests")
{
  Session session;
  CHECK(session.SetPaused(true));
  CHECK(session.GetMode() == Mode(ModeKind::Paused));
  CHECK(session.RequestStep());

  session.KeyDown(0x3);
  CHECK(session.GetSnapshot().keys == 0x0008);
  session.KeyUp(0x3);
  CHECK(session.GetSnapshot().keys == 0);

  const uint8_t rom[] = {0x60, 0x0A, 0xF0, 0x15}; // LD V0, 10; LD DT, V0
  REQUIRE(session.LoadProgram(rom, sizeof(rom)));
  CHECK(session.SetPaused(false));
  REQUIRE(session.EmulateCycle().Ok());
  REQUIRE(session.EmulateCycle().Ok());
  session.TickTimer();
  CHECK(session.GetSnapshot().delayTimer == 9);

  std::vector<HistoryEntry> history;
  session.CopyHistory(&history);
  REQUIRE(history.size() == 2);
  CHECK(history[0].instr.word == 0x600A);
  CHECK(history[1].instr.op == Opcode::SetDelayTimer);
}

TEST_CASE("a slot on a paused session never ticks the timer")
{
  Session session;
  const uint8_t rom[] = {
    0x6A, 0x0A, // LD VA, 10
    0xFA, 0x15, // LD DT, VA
    0x71, 0x01, // ADD V1, 1
  };
  REQUIRE(session.LoadProgram(rom, sizeof(rom)));

  bool executed = false;
  bool counted  = false;
  bool ticked   = false;
  REQUIRE(session.RunSlot(false, &executed, &counted, &ticked).Ok());
  REQUIRE(session.RunSlot(true, &executed, &counted, &ticked).Ok());
  CHECK(executed);
  CHECK(counted);
  CHECK(ticked);
  CHECK(session.GetSnapshot().delayTimer == 9);

  REQUIRE(session.SetPaused(true));
  REQUIRE(session.RunSlot(true, &executed, &counted, &ticked).Ok());
  CHECK_FALSE(executed);
  CHECK_FALSE(counted);
  CHECK_FALSE(ticked);
  CHECK(session.GetSnapshot().delayTimer == 9);

  // the slot that carries a requested step still counts
  REQUIRE(session.RequestStep());
  REQUIRE(session.RunSlot(true, &executed, &counted, &ticked).Ok());
  CHECK(executed);
  CHECK(counted);
  CHECK(ticked);
  CHECK(session.GetSnapshot().v[1] == 1);
  CHECK(session.GetSnapshot().delayTimer == 8);
}

TEST_CASE("snapshots taken during stepping only see whole instructions")
{
  Session session;
  const uint8_t rom[] = {
    0x71, 0x01, // 200: ADD V1, 1
    0x72, 0x01, // 202: ADD V2, 1
    0x12, 0x00, // 204: JP 200
  };
  REQUIRE(session.LoadProgram(rom, sizeof(rom)));

  std::atomic<bool> done(false);
  std::thread stepper([&session, &done] () {
    for (unsigned i = 0; i < 30000; ++i)
      session.EmulateCycle();
    done = true;
  });

  unsigned bad = 0;
  while (!done) {
    const Snapshot snap = session.GetSnapshot();
    const uint8_t diff = static_cast<uint8_t>(snap.v[1] - snap.v[2]);
    if (diff > 1)
      ++bad;
    if ((snap.pc != 0x200 && snap.pc != 0x202 && snap.pc != 0x204))
      ++bad;
  }
  stepper.join();

  CHECK(bad == 0);
  const Snapshot last = session.GetSnapshot();
  CHECK(last.v[1] == static_cast<uint8_t>(10000));
  CHECK(last.v[2] == static_cast<uint8_t>(10000));
}
