#include <gtest/gtest.h>
#include "evmasm_opcodes.h"

TEST(Opcodes, LooksUpPlainMnemonics) {
    EXPECT_EQ(specifierFromMnemonic("stop")->opcode, STOP);
    EXPECT_EQ(specifierFromMnemonic("pc")->opcode, GETPC);
    EXPECT_EQ(specifierFromMnemonic("jumpdest")->opcode, JUMPDEST);
    EXPECT_EQ(specifierFromMnemonic("selfdestruct")->opcode, SELFDESTRUCT);
    EXPECT_EQ(specifierFromMnemonic("keccak256")->size(), 1u);
}

TEST(Opcodes, MnemonicsAreCaseSensitive) {
    EXPECT_FALSE(specifierFromMnemonic("STOP"));
    EXPECT_FALSE(specifierFromMnemonic("Push1"));
    EXPECT_FALSE(specifierFromMnemonic("push0"));
    EXPECT_FALSE(specifierFromMnemonic("push33"));
    EXPECT_FALSE(specifierFromMnemonic("push01"));
}

TEST(Opcodes, FamiliesEncodeTheirSuffix) {
    EXPECT_EQ(specifierFromMnemonic("dup16")->opcode, DUP16);
    EXPECT_EQ(specifierFromMnemonic("swap4")->opcode, 0x93);
    EXPECT_EQ(specifierFromMnemonic("log0")->opcode, LOG0);
    EXPECT_EQ(specifierFromMnemonic("log4")->opcode, LOG4);
    EXPECT_FALSE(specifierFromMnemonic("log5"));
    EXPECT_FALSE(specifierFromMnemonic("dup0"));
}

TEST(Opcodes, PushSizeIsOpcodePlusWidth) {
    for (unsigned n = 1; n <= 32; ++n) {
        std::optional<Specifier> push = Specifier::push(n);
        ASSERT_TRUE(push);
        EXPECT_EQ(push->opcode, PUSH1 + n - 1);
        EXPECT_EQ(push->immediateWidth, n);
        EXPECT_EQ(push->size(), n + 1);
        EXPECT_EQ(*specifierFromMnemonic("push" + std::to_string(n)), *push);
    }
    EXPECT_FALSE(Specifier::push(0));
    EXPECT_FALSE(Specifier::push(33));
}

TEST(Opcodes, MnemonicRoundTrip) {
    EXPECT_EQ(mnemonicOf(*specifierFromMnemonic("pc")), "pc");
    EXPECT_EQ(specifierFromMnemonic("pc")->opcode, GETPC);
    EXPECT_EQ(mnemonicOf(*Specifier::push(32)), "push32");
}

TEST(Opcodes, TableIsOrderedAndUnique) {
    const auto& table = opcodeTable();
    ASSERT_FALSE(table.empty());
    for (size_t i = 1; i < table.size(); ++i) {
        EXPECT_LT(table[i - 1].spec.opcode, table[i].spec.opcode) << table[i].mnemonic;
    }
    EXPECT_EQ(table.front().mnemonic, "stop");
    EXPECT_EQ(table.back().mnemonic, "selfdestruct");
}
