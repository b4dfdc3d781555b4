#include "common/crypto_utils.h"
#include "counter/accounts.h"
#include "counter/instruction.h"
#include "counter/processor.h"
#include "counter/state.h"
#include "svm/system_program.h"
#include "test_framework.h"
#include <limits>

using namespace tally;
using namespace tally::counter;

namespace {

/**
 * InvokeContext stand-in that records calls and performs account creation
 * directly on the handles it is given
 */
class FakeInvokeContext : public svm::InvokeContext,
                          public svm::AccountCreationService {
public:
  svm::RentCalculator rent_calculator;
  std::vector<std::string> logs;
  int create_calls = 0;
  bool fail_creation = false;
  svm::CreationError creation_failure = svm::CreationError::ACCOUNT_ALREADY_IN_USE;
  Lamports requested_lamports = 0;
  uint64_t requested_space = 0;
  PublicKey requested_owner;

  const svm::RentCalculator &rent() const override { return rent_calculator; }

  svm::AccountCreationService &account_creation_service() override {
    return *this;
  }

  void log(const std::string &message) override { logs.push_back(message); }

  PublicKey program_id() const override { return svm::system_program_id(); }

  Result<bool, svm::CreationError>
  create_account(const svm::AccountInfo &funder,
                 const svm::AccountInfo &new_account, Lamports lamports,
                 uint64_t space, const PublicKey &owner) override {
    create_calls++;
    requested_lamports = lamports;
    requested_space = space;
    requested_owner = owner;
    if (fail_creation) {
      return make_error(creation_failure);
    }

    auto resized = new_account.realloc(static_cast<size_t>(space));
    if (resized.is_err()) {
      return make_error(svm::CreationError::ACCOUNT_BORROW_FAILED);
    }
    funder.set_lamports(funder.lamports() - lamports);
    new_account.set_lamports(new_account.lamports() + lamports);
    new_account.assign(owner);
    return Result<bool, svm::CreationError>(true);
  }
};

PublicKey test_program_id() {
  return CryptoUtils::derive_program_id("counter_program_test");
}

PublicKey key_of(uint8_t seed) { return PublicKey(PUBKEY_SIZE, seed); }

std::vector<uint8_t> le_bytes(uint64_t value) {
  std::vector<uint8_t> bytes;
  for (int i = 0; i < 8; ++i) {
    bytes.push_back((value >> (i * 8)) & 0xFF);
  }
  return bytes;
}

std::vector<uint8_t> initialize_data(uint64_t value) {
  std::vector<uint8_t> data = {0};
  auto payload = le_bytes(value);
  data.insert(data.end(), payload.begin(), payload.end());
  return data;
}

// Accounts for one InitializeCounter call, kept at stable addresses
struct InitializeFixture {
  svm::Account counter;
  svm::Account payer;
  svm::Account system;
  std::vector<svm::AccountInfo> infos;

  explicit InitializeFixture(Lamports payer_lamports = 1000000000) {
    payer.lamports = payer_lamports;
    system.executable = true;
    infos.emplace_back(key_of(1), &counter, true, true);
    infos.emplace_back(key_of(2), &payer, true, true);
    infos.emplace_back(svm::system_program_id(), &system, false, false);
  }
};

// A counter account already owned by the program
struct CounterFixture {
  svm::Account counter;
  std::vector<svm::AccountInfo> infos;

  CounterFixture(const PublicKey &owner, std::vector<uint8_t> data) {
    counter.lamports = 946560;
    counter.owner = owner;
    counter.data = std::move(data);
    infos.emplace_back(key_of(1), &counter, true, true);
  }
};

} // namespace

// Instruction decoding

void test_decode_initialize() {
  auto decoded = decode_instruction(initialize_data(0x0102030405060708ULL));
  ASSERT_TRUE(decoded.is_ok());
  ASSERT_ENUM_EQ(CounterInstruction::Kind::InitializeCounter,
                 decoded.value().kind);
  ASSERT_EQ(0x0102030405060708ULL, decoded.value().initial_value);

  auto max = decode_instruction(initialize_data(UINT64_MAX));
  ASSERT_TRUE(max.is_ok());
  ASSERT_EQ(UINT64_MAX, max.value().initial_value);
}

void test_decode_increment_ignores_trailing_bytes() {
  auto bare = decode_instruction({1});
  ASSERT_TRUE(bare.is_ok());
  ASSERT_ENUM_EQ(CounterInstruction::Kind::IncrementCounter, bare.value().kind);

  auto trailing = decode_instruction({1, 0xde, 0xad, 0xbe, 0xef});
  ASSERT_TRUE(trailing.is_ok());
  ASSERT_TRUE(trailing.value() == CounterInstruction::increment());
}

void test_decode_rejects_empty_and_unknown() {
  auto empty = decode_instruction({});
  ASSERT_TRUE(empty.is_err());
  ASSERT_ENUM_EQ(DecodeError::EMPTY, empty.error());

  for (uint8_t tag : {uint8_t(2), uint8_t(7), uint8_t(255)}) {
    auto unknown = decode_instruction({tag, 0, 0});
    ASSERT_TRUE(unknown.is_err());
    ASSERT_ENUM_EQ(DecodeError::UNKNOWN_OPERATION, unknown.error());
  }
}

void test_decode_rejects_malformed_initialize() {
  std::vector<uint8_t> short_payload = {0, 1, 2, 3, 4, 5, 6, 7};
  auto too_short = decode_instruction(short_payload);
  ASSERT_TRUE(too_short.is_err());
  ASSERT_ENUM_EQ(DecodeError::MALFORMED, too_short.error());

  auto tag_only = decode_instruction({0});
  ASSERT_TRUE(tag_only.is_err());
  ASSERT_ENUM_EQ(DecodeError::MALFORMED, tag_only.error());

  std::vector<uint8_t> long_payload = initialize_data(5);
  long_payload.push_back(0);
  auto too_long = decode_instruction(long_payload);
  ASSERT_TRUE(too_long.is_err());
  ASSERT_ENUM_EQ(DecodeError::MALFORMED, too_long.error());
}

void test_encode_canonical_forms() {
  ASSERT_TRUE(encode_instruction(CounterInstruction::initialize(42)) ==
              initialize_data(42));
  ASSERT_TRUE(encode_instruction(CounterInstruction::increment()) ==
              std::vector<uint8_t>{1});
}

void test_instruction_builders() {
  PublicKey program_id = test_program_id();
  auto init = make_initialize_instruction(program_id, key_of(1), key_of(2), 9);

  ASSERT_TRUE(init.program_id == program_id);
  ASSERT_EQ(3u, init.accounts.size());
  ASSERT_TRUE(init.accounts[0].pubkey == key_of(1));
  ASSERT_TRUE(init.accounts[0].is_signer && init.accounts[0].is_writable);
  ASSERT_TRUE(init.accounts[1].pubkey == key_of(2));
  ASSERT_TRUE(init.accounts[1].is_signer && init.accounts[1].is_writable);
  ASSERT_TRUE(init.accounts[2].pubkey == svm::system_program_id());
  ASSERT_FALSE(init.accounts[2].is_writable);
  ASSERT_TRUE(init.data == initialize_data(9));

  auto inc = make_increment_instruction(program_id, key_of(1));
  ASSERT_EQ(1u, inc.accounts.size());
  ASSERT_TRUE(inc.accounts[0].is_writable);
  ASSERT_TRUE(inc.data == std::vector<uint8_t>{1});
}

// Counter state layout

void test_state_read_little_endian() {
  auto state = read_counter_state(le_bytes(258));
  ASSERT_TRUE(state.is_ok());
  ASSERT_EQ(258u, state.value().count);

  std::vector<uint8_t> longer = le_bytes(3);
  longer.push_back(0xff);
  auto with_trailing = read_counter_state(longer);
  ASSERT_TRUE(with_trailing.is_ok());
  ASSERT_EQ(3u, with_trailing.value().count);
}

void test_state_read_truncated() {
  auto state = read_counter_state({1, 2, 3, 4, 5, 6, 7});
  ASSERT_TRUE(state.is_err());
  ASSERT_ENUM_EQ(DecodeError::TRUNCATED, state.error());

  ASSERT_TRUE(read_counter_state({}).is_err());
}

void test_state_write_preserves_trailing_bytes() {
  std::vector<uint8_t> data(10, 0xaa);
  auto written = write_counter_state(CounterState{1}, data);
  ASSERT_TRUE(written.is_ok());

  std::vector<uint8_t> expected = le_bytes(1);
  expected.push_back(0xaa);
  expected.push_back(0xaa);
  ASSERT_TRUE(data == expected);
}

void test_state_write_insufficient_space() {
  std::vector<uint8_t> data(4, 0x11);
  auto written = write_counter_state(CounterState{5}, data);
  ASSERT_TRUE(written.is_err());
  ASSERT_ENUM_EQ(EncodeError::INSUFFICIENT_SPACE, written.error());
  ASSERT_TRUE(data == std::vector<uint8_t>(4, 0x11));
}

void test_state_round_trip() {
  std::vector<uint8_t> bytes = {0x10, 0x32, 0x54, 0x76, 0x98, 0xba, 0xdc, 0xfe};
  std::vector<uint8_t> rewritten(8, 0);
  ASSERT_TRUE(write_counter_state(read_counter_state(bytes).value(), rewritten).is_ok());
  ASSERT_TRUE(rewritten == bytes);

  const uint64_t values[] = {0, 1, 1ULL << 32,
                             std::numeric_limits<uint64_t>::max()};
  for (uint64_t value : values) {
    CounterState state;
    state.count = value;
    std::vector<uint8_t> region(COUNTER_ACCOUNT_SIZE, 0xaa);
    ASSERT_TRUE(write_counter_state(state, region).is_ok());
    auto decoded = read_counter_state(region);
    ASSERT_TRUE(decoded.is_ok());
    ASSERT_EQ(value, decoded.value().count);
  }
}

// Account resolution

void test_resolve_initialize_accounts() {
  InitializeFixture fixture;
  auto roles = resolve_initialize_accounts(fixture.infos);
  ASSERT_TRUE(roles.is_ok());
  ASSERT_TRUE(roles.value().counter->key() == key_of(1));
  ASSERT_TRUE(roles.value().payer->key() == key_of(2));
  ASSERT_TRUE(roles.value().system_program->key() == svm::system_program_id());

  fixture.infos.pop_back();
  auto missing = resolve_initialize_accounts(fixture.infos);
  ASSERT_TRUE(missing.is_err());
  ASSERT_ENUM_EQ(ResolverError::MISSING_ACCOUNT, missing.error());
}

void test_resolve_increment_accounts() {
  PublicKey program_id = test_program_id();
  CounterFixture owned(program_id, le_bytes(0));
  ASSERT_TRUE(resolve_increment_accounts(program_id, owned.infos).is_ok());

  auto empty = resolve_increment_accounts(program_id, {});
  ASSERT_TRUE(empty.is_err());
  ASSERT_ENUM_EQ(ResolverError::MISSING_ACCOUNT, empty.error());

  CounterFixture foreign(key_of(9), le_bytes(0));
  auto not_owner = resolve_increment_accounts(program_id, foreign.infos);
  ASSERT_TRUE(not_owner.is_err());
  ASSERT_ENUM_EQ(ResolverError::NOT_OWNER, not_owner.error());
}

// Processor

void test_initialize_creates_rent_exempt_counter() {
  PublicKey program_id = test_program_id();
  InitializeFixture fixture;
  FakeInvokeContext context;

  auto result = process_instruction(program_id, fixture.infos,
                                    initialize_data(7), context);
  ASSERT_TRUE(result.is_ok());

  ASSERT_EQ(1, context.create_calls);
  ASSERT_EQ(946560u, context.requested_lamports);
  ASSERT_EQ(8u, context.requested_space);
  ASSERT_TRUE(context.requested_owner == program_id);

  ASSERT_TRUE(fixture.counter.owner == program_id);
  ASSERT_TRUE(fixture.counter.data == le_bytes(7));
  ASSERT_EQ(946560u, fixture.counter.lamports);
  ASSERT_EQ(1000000000u - 946560u, fixture.payer.lamports);

  ASSERT_EQ(1u, context.logs.size());
  ASSERT_EQ(std::string("Counter initialized with value 7"), context.logs[0]);
}

void test_initialize_rejects_wrong_service_account() {
  InitializeFixture fixture;
  fixture.infos[2] = svm::AccountInfo(key_of(3), &fixture.system, false, false);
  FakeInvokeContext context;

  auto result = process_instruction(test_program_id(), fixture.infos,
                                    initialize_data(1), context);
  ASSERT_TRUE(result.is_err());
  ASSERT_EQ(ProcessError::from(svm::CreationError::INCORRECT_PROGRAM_ID),
            result.error());
  ASSERT_EQ(0, context.create_calls);
  ASSERT_TRUE(fixture.counter.data.empty());
}

void test_initialize_passes_creation_failure_through() {
  InitializeFixture fixture;
  FakeInvokeContext context;
  context.fail_creation = true;
  context.creation_failure = svm::CreationError::INSUFFICIENT_FUNDS;

  auto result = process_instruction(test_program_id(), fixture.infos,
                                    initialize_data(1), context);
  ASSERT_TRUE(result.is_err());
  ASSERT_EQ(ProcessError::from(svm::CreationError::INSUFFICIENT_FUNDS),
            result.error());
  ASSERT_TRUE(context.logs.empty());
  ASSERT_ENUM_EQ(svm::ExecutionResult::INSUFFICIENT_FUNDS,
                 to_execution_result(result.error()));
}

void test_initialize_missing_accounts() {
  InitializeFixture fixture;
  fixture.infos.resize(2);
  FakeInvokeContext context;

  auto result = process_instruction(test_program_id(), fixture.infos,
                                    initialize_data(1), context);
  ASSERT_TRUE(result.is_err());
  ASSERT_EQ(ProcessError::from(ResolverError::MISSING_ACCOUNT), result.error());
  ASSERT_EQ(0, context.create_calls);
}

void test_increment_adds_one() {
  PublicKey program_id = test_program_id();
  CounterFixture fixture(program_id, le_bytes(41));
  FakeInvokeContext context;

  auto result = process_instruction(program_id, fixture.infos, {1}, context);
  ASSERT_TRUE(result.is_ok());
  ASSERT_TRUE(fixture.counter.data == le_bytes(42));
  ASSERT_EQ(std::string("Counter incremented to 42"), context.logs.back());
  ASSERT_EQ(0, context.create_calls);
}

void test_repeated_increments_count_calls() {
  PublicKey program_id = test_program_id();
  CounterFixture fixture(program_id, le_bytes(0));
  FakeInvokeContext context;

  const uint64_t calls = 25;
  for (uint64_t i = 0; i < calls; ++i) {
    ASSERT_TRUE(process_increment_counter(program_id, fixture.infos, context).is_ok());
  }
  ASSERT_EQ(calls, read_counter_state(fixture.counter.data).value().count);
}

void test_increment_overflow_leaves_state() {
  PublicKey program_id = test_program_id();
  CounterFixture fixture(program_id, le_bytes(UINT64_MAX));
  FakeInvokeContext context;

  auto result = process_instruction(program_id, fixture.infos, {1}, context);
  ASSERT_TRUE(result.is_err());
  ASSERT_EQ(ProcessError::overflow(), result.error());
  ASSERT_TRUE(fixture.counter.data == le_bytes(UINT64_MAX));
  ASSERT_TRUE(context.logs.empty());
  ASSERT_ENUM_EQ(svm::ExecutionResult::ARITHMETIC_OVERFLOW,
                 to_execution_result(result.error()));
}

void test_increment_foreign_account_untouched() {
  CounterFixture fixture(key_of(9), le_bytes(5));
  FakeInvokeContext context;

  auto result = process_instruction(test_program_id(), fixture.infos, {1}, context);
  ASSERT_TRUE(result.is_err());
  ASSERT_EQ(ProcessError::from(ResolverError::NOT_OWNER), result.error());
  ASSERT_TRUE(fixture.counter.data == le_bytes(5));
  ASSERT_ENUM_EQ(svm::ExecutionResult::INCORRECT_PROGRAM_ID,
                 to_execution_result(result.error()));
}

void test_increment_truncated_account() {
  PublicKey program_id = test_program_id();
  CounterFixture fixture(program_id, {1, 2, 3});
  FakeInvokeContext context;

  auto result = process_instruction(program_id, fixture.infos, {1}, context);
  ASSERT_TRUE(result.is_err());
  ASSERT_EQ(ProcessError::from(DecodeError::TRUNCATED), result.error());
  ASSERT_TRUE(fixture.counter.data == std::vector<uint8_t>({1, 2, 3}));
  ASSERT_ENUM_EQ(svm::ExecutionResult::INVALID_ACCOUNT_DATA,
                 to_execution_result(result.error()));
}

void test_increment_while_borrowed() {
  PublicKey program_id = test_program_id();
  CounterFixture fixture(program_id, le_bytes(1));
  FakeInvokeContext context;

  auto held = fixture.infos[0].try_borrow_data();
  ASSERT_TRUE(held.is_ok());

  auto result = process_instruction(program_id, fixture.infos, {1}, context);
  ASSERT_TRUE(result.is_err());
  ASSERT_EQ(ProcessError::borrow_failed(), result.error());
  ASSERT_TRUE(fixture.counter.data == le_bytes(1));
}

void test_process_rejects_bad_instruction_data() {
  InitializeFixture fixture;
  FakeInvokeContext context;

  auto empty = process_instruction(test_program_id(), fixture.infos, {}, context);
  ASSERT_TRUE(empty.is_err());
  ASSERT_EQ(ProcessError::from(DecodeError::EMPTY), empty.error());

  auto unknown = process_instruction(test_program_id(), fixture.infos, {2}, context);
  ASSERT_TRUE(unknown.is_err());
  ASSERT_ENUM_EQ(svm::ExecutionResult::INVALID_INSTRUCTION,
                 to_execution_result(unknown.error()));
  ASSERT_EQ(0, context.create_calls);
}

void test_counter_program_outcome() {
  PublicKey program_id = test_program_id();
  CounterProgram program(program_id);
  ASSERT_TRUE(program.get_program_id() == program_id);
  ASSERT_TRUE(CounterProgram().get_program_id() ==
              CryptoUtils::derive_program_id(CounterProgram::DEFAULT_PROGRAM_NAME));

  CounterFixture fixture(program_id, le_bytes(UINT64_MAX));
  FakeInvokeContext context;
  svm::Instruction instruction = make_increment_instruction(program_id, key_of(1));

  auto outcome = program.execute(instruction, fixture.infos, context);
  ASSERT_FALSE(outcome.is_success());
  ASSERT_ENUM_EQ(svm::ExecutionResult::ARITHMETIC_OVERFLOW, outcome.result);
  ASSERT_EQ(std::string("counter overflow"), outcome.error_details);
}

void run_counter_program_tests(TestRunner &runner) {
  runner.run_test("Decode Initialize", test_decode_initialize);
  runner.run_test("Decode Increment Trailing Bytes",
                  test_decode_increment_ignores_trailing_bytes);
  runner.run_test("Decode Empty And Unknown",
                  test_decode_rejects_empty_and_unknown);
  runner.run_test("Decode Malformed Initialize",
                  test_decode_rejects_malformed_initialize);
  runner.run_test("Encode Canonical Forms", test_encode_canonical_forms);
  runner.run_test("Instruction Builders", test_instruction_builders);
  runner.run_test("State Read Little Endian", test_state_read_little_endian);
  runner.run_test("State Read Truncated", test_state_read_truncated);
  runner.run_test("State Write Trailing Bytes",
                  test_state_write_preserves_trailing_bytes);
  runner.run_test("State Write Insufficient Space",
                  test_state_write_insufficient_space);
  runner.run_test("State Round Trip", test_state_round_trip);
  runner.run_test("Resolve Initialize Accounts",
                  test_resolve_initialize_accounts);
  runner.run_test("Resolve Increment Accounts",
                  test_resolve_increment_accounts);
  runner.run_test("Initialize Creates Counter",
                  test_initialize_creates_rent_exempt_counter);
  runner.run_test("Initialize Wrong Service Account",
                  test_initialize_rejects_wrong_service_account);
  runner.run_test("Initialize Creation Failure",
                  test_initialize_passes_creation_failure_through);
  runner.run_test("Initialize Missing Accounts",
                  test_initialize_missing_accounts);
  runner.run_test("Increment Adds One", test_increment_adds_one);
  runner.run_test("Repeated Increments", test_repeated_increments_count_calls);
  runner.run_test("Increment Overflow", test_increment_overflow_leaves_state);
  runner.run_test("Increment Foreign Account",
                  test_increment_foreign_account_untouched);
  runner.run_test("Increment Truncated Account",
                  test_increment_truncated_account);
  runner.run_test("Increment While Borrowed", test_increment_while_borrowed);
  runner.run_test("Bad Instruction Data",
                  test_process_rejects_bad_instruction_data);
  runner.run_test("Counter Program Outcome", test_counter_program_outcome);
}

#ifndef COMPREHENSIVE_TESTS
int main() {
  std::cout << "=== Counter Program Test Suite ===" << std::endl;
  TestRunner runner;
  run_counter_program_tests(runner);
  runner.print_summary();
  return runner.all_passed() ? 0 : 1;
}
#endif
