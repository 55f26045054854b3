#include "../crypto/SecretSharing.h"
#include "../ledger/Config.h"
#include "../ledger/ProofOfWork.h"
#include "../ledger/VoteEncoder.h"
#include "../ledger/VoteLedger.h"
#include "../lib/Logger.h"
#include "../lib/Utilities.h"

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include <iostream>
#include <string>
#include <vector>

namespace {

struct VoteOptions {
  std::string voterId;
  std::string candidateId;
  std::string candidateName;
  std::string party;
  std::string constituencyId{"C-001"};
  int count{1};
};

void printReceipt(const vl::VoteLedger::AppendResult &result) {
  const auto &block = *result.block;
  std::cout << "Block #" << block.index << " mined in " << result.elapsedMs
            << " ms (" << result.attempts << " attempts)\n";
  std::cout << "  hash:     " << block.hash << "\n";
  std::cout << "  previous: " << block.previousHash.substr(0, 16) << "...\n";
}

int castVotes(vl::VoteLedger &ledger, const vl::Config &config,
              const VoteOptions &options, vl::logging::Logger &logger) {
  vl::VoteEncoder encoder;
  std::string voterHash =
      vl::VoteEncoder::deriveVoterHash(options.voterId, config.voterSalt);

  for (int i = 0; i < options.count; ++i) {
    vl::VoteEncoder::VotePayload payload;
    payload.candidateId = options.candidateId;
    payload.candidateName = options.candidateName;
    payload.party = options.party;
    payload.constituencyId = options.constituencyId;

    auto encoded = encoder.encode(payload);
    auto result = ledger.submitVote(encoded.opaque, voterHash);
    if (!result) {
      logger.error << "Vote rejected: " << result.error();
      std::cerr << "Error: " << result.error().message << "\n";
      return 1;
    }
    printReceipt(result.value());
  }
  return 0;
}

int runVote(const vl::Config &config, const VoteOptions &options,
            vl::logging::Logger &logger) {
  vl::VoteLedger ledger(config.toLedgerConfig());
  int rc = castVotes(ledger, config, options, logger);
  if (rc != 0) {
    return rc;
  }

  auto validation = ledger.validateChain();
  std::cout << "Statistics: " << ledger.getStatistics().toJson().dump() << "\n";
  std::cout << "Validation: " << validation.toJson().dump() << "\n";
  return validation.isValid ? 0 : 1;
}

int runAudit(const vl::Config &config, int votes, std::string output,
             vl::logging::Logger &logger) {
  vl::VoteLedger ledger(config.toLedgerConfig());
  vl::VoteEncoder encoder;
  static const std::vector<std::string> candidates = {"CAND-A", "CAND-B",
                                                      "CAND-C"};

  for (int i = 0; i < votes; ++i) {
    vl::VoteEncoder::VotePayload payload;
    payload.candidateId = candidates[static_cast<size_t>(i) % candidates.size()];
    payload.candidateName = "Candidate " + payload.candidateId.substr(5);
    payload.constituencyId = "C-001";

    std::string voterHash = vl::VoteEncoder::deriveVoterHash(
        "VOTER-" + std::to_string(i + 1), config.voterSalt);
    auto result = ledger.submitVote(encoder.encode(payload).opaque, voterHash);
    if (!result) {
      std::cerr << "Error: " << result.error().message << "\n";
      return 1;
    }
    printReceipt(result.value());
  }

  auto validation = ledger.validateChain();
  if (!validation.isValid) {
    logger.error << "Chain failed validation: " << validation;
  }

  if (output.empty()) {
    output = "electoral-audit-" +
             vl::utl::formatIsoDate(vl::utl::getCurrentTimeMs()) + ".json";
  }
  auto written = vl::utl::writeToNewFile(output, ledger.exportAudit().dump(2));
  if (!written) {
    std::cerr << "Error: " << written.error().message << "\n";
    return 1;
  }
  logger.info << "Audit export written to " << output;
  std::cout << "Audit export written to " << output << "\n";
  return validation.isValid ? 0 : 1;
}

int runSplit(const vl::Config &config, const std::string &secretHex, int n,
             int k) {
  std::vector<uint8_t> secret;
  if (secretHex.empty()) {
    secret = vl::VoteEncoder::generateKeyMaterial();
    std::cout << "Generated key: " << vl::utl::hexEncode(secret) << "\n";
  } else if (!vl::utl::hexDecode(secretHex, secret) || secret.empty()) {
    std::cerr << "Error: Secret must be non-empty hex\n";
    return 1;
  }

  vl::crypto::SecretSharing sharing;
  auto shards = sharing.splitToShards(secret, n > 0 ? n : config.shareTotal,
                                      k > 0 ? k : config.shareThreshold);
  if (!shards) {
    std::cerr << "Error: " << shards.error().message << "\n";
    return 1;
  }
  for (const auto &shard : shards.value()) {
    std::cout << shard << "\n";
  }
  return 0;
}

int runCombine(const std::vector<std::string> &shards) {
  vl::crypto::SecretSharing sharing;
  auto secret = sharing.combineShards(shards);
  if (!secret) {
    std::cerr << "Error: " << secret.error().message << "\n";
    return 1;
  }
  std::cout << vl::utl::hexEncode(secret.value()) << "\n";
  return 0;
}

int runMine(const vl::Config &config, const std::string &payload,
            const std::string &previousHash, int difficulty) {
  vl::ProofOfWork::Config powConfig;
  powConfig.maxAttempts = config.maxAttempts;
  powConfig.yieldInterval = config.yieldInterval;
  vl::ProofOfWork pow(powConfig);

  uint32_t target = difficulty >= 0 ? static_cast<uint32_t>(difficulty)
                                    : config.difficulty;
  auto result = pow.mine(payload, previousHash, target);
  if (!result) {
    std::cerr << "Error: " << result.error().message << "\n";
    return 1;
  }
  nlohmann::ordered_json j;
  j["nonce"] = result->nonce;
  j["hash"] = result->hash;
  j["attempts"] = result->attempts;
  std::cout << j.dump(2) << "\n";
  return 0;
}

} // namespace

int main(int argc, char *argv[]) {
  CLI::App app{"vote-ledger - Tamper-evident vote ledger and key sharding tool"};
  app.require_subcommand(1);

  bool debug = false;
  app.add_flag("--debug", debug, "Enable debug logging");

  std::string configPath;
  app.add_option("-c,--config", configPath, "JSON configuration file")
      ->check(CLI::ExistingFile);

  // vote
  auto *vote_cmd = app.add_subcommand("vote", "Cast votes on a fresh in-memory ledger");
  VoteOptions voteOptions;
  vote_cmd->add_option("--voter", voteOptions.voterId, "Voter national ID")
      ->required();
  vote_cmd->add_option("--candidate", voteOptions.candidateId, "Candidate ID")
      ->required();
  vote_cmd->add_option("--name", voteOptions.candidateName, "Candidate name");
  vote_cmd->add_option("--party", voteOptions.party, "Candidate party");
  vote_cmd->add_option("--constituency", voteOptions.constituencyId,
                       "Constituency ID")
      ->capture_default_str();
  vote_cmd->add_option("--count", voteOptions.count,
                       "Number of times to cast the vote")
      ->check(CLI::Range(1, 1000))
      ->capture_default_str();

  // audit
  auto *audit_cmd =
      app.add_subcommand("audit", "Cast demo votes and write the audit export");
  int auditVotes = 3;
  std::string auditOutput;
  audit_cmd->add_option("--votes", auditVotes, "Number of demo votes")
      ->check(CLI::Range(0, 1000))
      ->capture_default_str();
  audit_cmd->add_option("-o,--output", auditOutput,
                        "Output file (must not exist, default "
                        "electoral-audit-YYYY-MM-DD.json)");

  // split
  auto *split_cmd = app.add_subcommand("split", "Split a key into shards");
  std::string splitSecret;
  int splitTotal = 0;
  int splitThreshold = 0;
  split_cmd->add_option("--secret", splitSecret,
                        "Secret as hex; if omitted, a random 32-byte key is generated");
  split_cmd->add_option("-n,--shares", splitTotal,
                        "Number of shards (default from config)")
      ->check(CLI::Range(1, vl::crypto::SecretSharing::MAX_SHARES));
  split_cmd->add_option("-k,--threshold", splitThreshold,
                        "Shards needed to reconstruct (default from config)")
      ->check(CLI::Range(1, vl::crypto::SecretSharing::MAX_SHARES));

  // combine
  auto *combine_cmd =
      app.add_subcommand("combine", "Reconstruct a key from shards");
  std::vector<std::string> combineShards;
  combine_cmd->add_option("shards", combineShards, "Shards (SHARD-NN:hex)")
      ->required();

  // mine
  auto *mine_cmd = app.add_subcommand("mine", "Run proof-of-work on a payload");
  std::string minePayload;
  std::string minePrevious = vl::Block::genesis().hash;
  int mineDifficulty = -1;
  mine_cmd->add_option("payload", minePayload, "Payload to mine")->required();
  mine_cmd->add_option("--previous", minePrevious, "Previous block hash")
      ->capture_default_str();
  mine_cmd->add_option("-d,--difficulty", mineDifficulty,
                       "Leading zero hex digits (default from config)")
      ->check(CLI::Range(0, static_cast<int>(vl::ProofOfWork::MAX_DIFFICULTY)));

  CLI11_PARSE(app, argc, argv);

  vl::Config config;
  if (!configPath.empty()) {
    auto loaded = vl::Config::load(configPath);
    if (!loaded) {
      std::cerr << "Error: " << loaded.error().message << "\n";
      return 1;
    }
    config = loaded.value();
  }

  auto logSetup = config.configureLogging(debug);
  if (!logSetup) {
    std::cerr << "Error: " << logSetup.error().message << "\n";
    return 1;
  }
  auto logger = vl::logging::getLogger("app");
  logger.debug << "Using " << config;

  try {
    if (*vote_cmd) {
      return runVote(config, voteOptions, logger);
    }
    if (*audit_cmd) {
      return runAudit(config, auditVotes, auditOutput, logger);
    }
    if (*split_cmd) {
      return runSplit(config, splitSecret, splitTotal, splitThreshold);
    }
    if (*combine_cmd) {
      return runCombine(combineShards);
    }
    if (*mine_cmd) {
      return runMine(config, minePayload, minePrevious, mineDifficulty);
    }
  } catch (const std::exception &e) {
    logger.critical << "Unhandled exception: " << e.what();
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  return 0;
}
