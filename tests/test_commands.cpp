#include <gtest/gtest.h>
#include <set>
#include "pixsync_commands.h"
#include "pixsync_state.h"

TEST(Commands, TableIsInEnumOrderWithUniqueSymbols) {
  const auto &t = command_table();
  std::set<std::string> seen;
  for (size_t i = 0; i < t.size(); i++) {
    EXPECT_EQ((size_t)t[i].id, i) << t[i].symbol;
    EXPECT_TRUE(seen.insert(t[i].symbol).second) << "duplicate " << t[i].symbol;
    EXPECT_EQ(&command_get(t[i].id), &t[i]);
  }
}

TEST(Commands, ResolveKnownAndUnknown) {
  command_def c;
  sync_error err;
  ASSERT_TRUE(command_resolve("GET_CONFIGURATION", &c, &err));
  EXPECT_EQ(c.id, command_id::GET_CONFIGURATION);
  EXPECT_EQ(c.group, command_group::INTERNAL);
  EXPECT_EQ(c.nr_params, 0);

  ASSERT_TRUE(command_resolve("CHANGE_BRIGHTNESS", &c, &err));
  EXPECT_EQ(c.group, command_group::OPERATIONAL);
  EXPECT_EQ(c.nr_params, 1);

  EXPECT_FALSE(command_resolve("get_configuration", &c, &err));
  EXPECT_EQ(err.code, sync_errc::UNKNOWN_COMMAND);
  err.clear();
  EXPECT_FALSE(command_resolve("", &c, &err));
  EXPECT_EQ(err.code, sync_errc::UNKNOWN_COMMAND);
}

TEST(Commands, ArgumentCountMismatchOnlyWithoutBlob) {
  const command_def &c = command_get(command_id::CHANGE_GENERATOR_A);
  sync_error err;
  EXPECT_TRUE(command_validate(c, 1, false, &err));
  EXPECT_FALSE(command_validate(c, 0, false, &err));
  EXPECT_EQ(err.code, sync_errc::ARGUMENT_COUNT_MISMATCH);
  err.clear();
  EXPECT_FALSE(command_validate(c, 2, false, &err));
  EXPECT_TRUE(command_validate(c, 0, true, &err));
  EXPECT_TRUE(command_validate(c, 5, true, &err));
}

TEST(Commands, OscGeneratorsAreNeverChecked) {
  sync_error err;
  for (command_id id : {command_id::OSC_GENERATOR1, command_id::OSC_GENERATOR2}) {
    EXPECT_TRUE(command_is_arg_count_exempt(id));
    EXPECT_TRUE(command_validate(command_get(id), 0, false, &err));
    EXPECT_TRUE(command_validate(command_get(id), 7, false, &err));
  }
  EXPECT_FALSE(command_is_arg_count_exempt(command_id::GET_VERSION));
}

TEST(Commands, ThirteenInternalCommands) {
  int internal = 0;
  for (const auto &c : command_table()) {
    if (c.group == command_group::INTERNAL) internal++;
  }
  EXPECT_EQ(internal, 13);
}

TEST(Commands, BootstrapSetIsElevenGetCommandsBoundToKinds) {
  const auto &req = required_bootstrap_commands();
  ASSERT_EQ(req.size(), (size_t)STATE_KIND_COUNT);
  std::set<int> kinds;
  for (command_id id : req) {
    const command_def &c = command_get(id);
    EXPECT_EQ(c.group, command_group::INTERNAL);
    EXPECT_EQ(std::string(c.symbol).compare(0, 4, "GET_"), 0);
    state_kind k;
    ASSERT_TRUE(state_kind_for_command(id, &k)) << c.symbol;
    EXPECT_EQ(command_for_state_kind(k), id);
    kinds.insert((int)k);
  }
  EXPECT_EQ(kinds.size(), (size_t)STATE_KIND_COUNT);

  state_kind k;
  EXPECT_FALSE(state_kind_for_command(command_id::REGISTER_VISUALOBSERVER, &k));
  EXPECT_FALSE(state_kind_for_command(command_id::CHANGE_MIXER, &k));
}

TEST(Commands, StateKindNamesRoundTrip) {
  for (int i = 0; i < STATE_KIND_COUNT; i++) {
    state_kind k;
    ASSERT_TRUE(state_kind_from_name(state_kind_name((state_kind)i), &k));
    EXPECT_EQ((int)k, i);
  }
  state_kind k;
  EXPECT_FALSE(state_kind_from_name("nope", &k));
}
