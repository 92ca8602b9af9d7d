#include <cstdint>
#include <cstring>

#include <doctest/doctest.h>

#include "chip8vm/instruction.hpp"

using namespace Chip8Vm;

/* ------------------------------------------------------------------------- */
/* Helpers                                                                   */
/* ------------------------------------------------------------------------- */
static Opcode DecodeOp (uint16_t word)
{
  Instruction instr;
  REQUIRE(Decode(word, &instr) == ErrorCode::None);
  return instr.op;
}

/* ------------------------------------------------------------------------- */
/* Opcode table                                                              */
/* ------------------------------------------------------------------------- */
TEST_CASE("every opcode pattern decodes to its instruction")
{
  CHECK(DecodeOp(0x00E0) == Opcode::Clear);
  CHECK(DecodeOp(0x00EE) == Opcode::Return);
  CHECK(DecodeOp(0x1ABC) == Opcode::Jump);
  CHECK(DecodeOp(0x2ABC) == Opcode::Call);
  CHECK(DecodeOp(0x3A12) == Opcode::SkipEqImm);
  CHECK(DecodeOp(0x4A12) == Opcode::SkipNeqImm);
  CHECK(DecodeOp(0x5AB0) == Opcode::SkipEqReg);
  CHECK(DecodeOp(0x6A12) == Opcode::LoadImm);
  CHECK(DecodeOp(0x7A12) == Opcode::AddImm);
  CHECK(DecodeOp(0x8AB0) == Opcode::Copy);
  CHECK(DecodeOp(0x8AB1) == Opcode::Or);
  CHECK(DecodeOp(0x8AB2) == Opcode::And);
  CHECK(DecodeOp(0x8AB3) == Opcode::Xor);
  CHECK(DecodeOp(0x8AB4) == Opcode::AddReg);
  CHECK(DecodeOp(0x8AB5) == Opcode::SubReg);
  CHECK(DecodeOp(0x8AB6) == Opcode::ShiftRight);
  CHECK(DecodeOp(0x8AB7) == Opcode::SubRegReverse);
  CHECK(DecodeOp(0x8ABE) == Opcode::ShiftLeft);
  CHECK(DecodeOp(0x9AB0) == Opcode::SkipNeqReg);
  CHECK(DecodeOp(0xAABC) == Opcode::LoadI);
  CHECK(DecodeOp(0xBABC) == Opcode::JumpV0Offset);
  CHECK(DecodeOp(0xDAB5) == Opcode::DrawSprite);
  CHECK(DecodeOp(0xEA9E) == Opcode::SkipIfKeyDown);
  CHECK(DecodeOp(0xEAA1) == Opcode::SkipIfKeyUp);
  CHECK(DecodeOp(0xFA07) == Opcode::ReadDelayTimer);
  CHECK(DecodeOp(0xFA0A) == Opcode::WaitForKey);
  CHECK(DecodeOp(0xFA15) == Opcode::SetDelayTimer);
  CHECK(DecodeOp(0xFA1E) == Opcode::AddXToI);
  CHECK(DecodeOp(0xFA29) == Opcode::LoadFontChar);
  CHECK(DecodeOp(0xFA33) == Opcode::StoreBcd);
  CHECK(DecodeOp(0xFA55) == Opcode::StoreRegisters);
  CHECK(DecodeOp(0xFA65) == Opcode::LoadRegisters);
}

TEST_CASE("operands are split from the nibbles")
{
  Instruction instr;

  REQUIRE(Decode(0xD3A7, &instr) == ErrorCode::None);
  CHECK(instr.x == 0x3);
  CHECK(instr.y == 0xA);
  CHECK(instr.n == 0x7);
  CHECK(instr.word == 0xD3A7);

  REQUIRE(Decode(0x6C2F, &instr) == ErrorCode::None);
  CHECK(instr.x == 0xC);
  CHECK(instr.byte == 0x2F);

  REQUIRE(Decode(0xA123, &instr) == ErrorCode::None);
  CHECK(instr.address == 0x123);
}

/* ------------------------------------------------------------------------- */
/* Unknown words                                                             */
/* ------------------------------------------------------------------------- */
TEST_CASE("words outside the table are unknown instructions")
{
  const uint16_t unknown[] = {
    0x0000, 0x0123, 0x00E1, 0x5121, 0x8008, 0x800F, 0x9001,
    0xC0FF, 0xE000, 0xE09F, 0xF018, 0xF000, 0xFFFF,
  };

  for (unsigned i = 0; i < sizeof(unknown) / sizeof(unknown[0]); ++i) {
    CAPTURE(unknown[i]);
    CHECK(Decode(unknown[i], nullptr) == ErrorCode::UnknownInstruction);
  }
}

TEST_CASE("a failed decode leaves the output untouched")
{
  Instruction instr;
  REQUIRE(Decode(0x6A05, &instr) == ErrorCode::None);

  CHECK(Decode(0xF0FF, &instr) == ErrorCode::UnknownInstruction);
  CHECK(instr.op == Opcode::LoadImm);
  CHECK(instr.word == 0x6A05);
}

/* ------------------------------------------------------------------------- */
/* Tracing text                                                              */
/* ------------------------------------------------------------------------- */
TEST_CASE("instructions format as mnemonics")
{
  Instruction instr;
  char text[32];

  REQUIRE(Decode(0x8344, &instr) == ErrorCode::None);
  FormatInstruction(instr, text, sizeof(text));
  CHECK(std::strcmp(text, "ADD V3, V4") == 0);

  REQUIRE(Decode(0xD015, &instr) == ErrorCode::None);
  FormatInstruction(instr, text, sizeof(text));
  CHECK(std::strcmp(text, "DRW V0, V1, 5") == 0);

  REQUIRE(Decode(0xA2A0, &instr) == ErrorCode::None);
  FormatInstruction(instr, text, sizeof(text));
  CHECK(std::strcmp(text, "LD I, 0x2A0") == 0);

  REQUIRE(Decode(0x00EE, &instr) == ErrorCode::None);
  FormatInstruction(instr, text, sizeof(text));
  CHECK(std::strcmp(text, "RET") == 0);
  CHECK(std::strcmp(OpcodeName(instr.op), "Return") == 0);
}
