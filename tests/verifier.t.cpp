#include <Macaroon/verifier.hpp>
#include <Macaroon/crypto.hpp>

#include "test-common.hpp"

#include <catch2/catch.hpp>

#include <map>
#include <set>
#include <sstream>

namespace macaroon {
  namespace tests {

    class ConditionNotMet : public std::runtime_error
    {
    public:
      explicit
      ConditionNotMet(const std::string& what)
        : std::runtime_error(what)
      {
      }
    };

    // A caveat with an empty location is a first party caveat.
    struct CaveatSpec
    {
      std::string condition;
      std::string location;
      std::string rootKey;
    };

    struct MacaroonSpec
    {
      std::string rootKey;
      std::string id;
      std::vector<CaveatSpec> caveats;
      std::string location;
    };

    struct ConditionTest
    {
      std::map<std::string, bool> conditions;
      // Empty when verification must succeed.
      std::string expectErr;
    };

    struct VerifyTest
    {
      std::string about;
      std::vector<MacaroonSpec> macaroons;
      std::vector<ConditionTest> conditions;
    };

    // Mints every macaroon and binds all but the first to the first.
    static Slice
    makeMacaroons(const std::vector<MacaroonSpec>& specs)
    {
      Slice macaroons;
      for (const MacaroonSpec& spec : specs) {
        Macaroon m(makeBuffer(spec.rootKey), spec.id, spec.location);
        for (const CaveatSpec& caveat : spec.caveats) {
          if (caveat.location.empty())
            m.addFirstPartyCaveat(caveat.condition);
          else
            m.addThirdPartyCaveat(makeBuffer(caveat.rootKey), caveat.condition, caveat.location);
        }
        macaroons.push_back(m);
      }

      for (size_t i = 1; i < macaroons.size(); ++i)
        macaroons[i].bind(macaroons[0].getSignature());
      return macaroons;
    }

    // Empty if verification succeeded, the error message otherwise.
    static std::string
    verifyError(const Macaroon& primary, const Buffer& rootKey,
                const ConditionChecker& check, const Slice& discharges)
    {
      try {
        primary.verify(rootKey, check, discharges);
      }
      catch (const std::exception& e) {
        return e.what();
      }
      return "";
    }

    static const std::vector<MacaroonSpec> RECURSIVE_THIRD_PARTY_CAVEAT_MACAROONS = {
      {"root-key", "root-id", {
          {"wonderful", "", ""},
          {"bob-is-great", "bob", "bob-caveat-root-key"},
          {"charlie-is-great", "charlie", "charlie-caveat-root-key"}}, ""},
      {"bob-caveat-root-key", "bob-is-great", {
          {"splendid", "", ""},
          {"barbara-is-great", "barbara", "barbara-caveat-root-key"}}, "bob"},
      {"charlie-caveat-root-key", "charlie-is-great", {
          {"splendid", "", ""},
          {"celine-is-great", "celine", "celine-caveat-root-key"}}, "charlie"},
      {"barbara-caveat-root-key", "barbara-is-great", {
          {"spiffing", "", ""},
          {"ben-is-great", "ben", "ben-caveat-root-key"}}, "barbara"},
      {"ben-caveat-root-key", "ben-is-great", {}, "ben"},
      {"celine-caveat-root-key", "celine-is-great", {
          {"high-fiving", "", ""}}, "celine"},
    };

    static const std::vector<VerifyTest> VERIFY_TESTS = {
      {
        "single third party caveat without discharge",
        {
          {"root-key", "root-id", {
              {"wonderful", "", ""},
              {"bob-is-great", "bob", "bob-caveat-root-key"}}, ""},
        },
        {
          {{{"wonderful", true}}, "cannot find discharge macaroon for caveat \"bob-is-great\""},
        },
      },
      {
        "single third party caveat with discharge",
        {
          {"root-key", "root-id", {
              {"wonderful", "", ""},
              {"bob-is-great", "bob", "bob-caveat-root-key"}}, ""},
          {"bob-caveat-root-key", "bob-is-great", {}, "bob"},
        },
        {
          {{{"wonderful", true}}, ""},
          {{{"wonderful", false}}, "condition \"wonderful\" not met"},
        },
      },
      {
        "single third party caveat with discharge with mismatching root key",
        {
          {"root-key", "root-id", {
              {"wonderful", "", ""},
              {"bob-is-great", "bob", "bob-caveat-root-key"}}, ""},
          {"bob-caveat-root-key-wrong", "bob-is-great", {}, "bob"},
        },
        {
          {{{"wonderful", true}}, "signature mismatch after caveat verification"},
        },
      },
      {
        "single third party caveat with two discharges",
        {
          {"root-key", "root-id", {
              {"wonderful", "", ""},
              {"bob-is-great", "bob", "bob-caveat-root-key"}}, ""},
          {"bob-caveat-root-key", "bob-is-great", {
              {"splendid", "", ""}}, "bob"},
          {"bob-caveat-root-key", "bob-is-great", {
              {"top of the world", "", ""}}, "bob"},
        },
        {
          {{{"wonderful", true}}, "condition \"splendid\" not met"},
          {{{"wonderful", true}, {"splendid", true}, {"top of the world", true}},
           "discharge macaroon \"bob-is-great\" was not used"},
          {{{"wonderful", true}, {"splendid", false}, {"top of the world", true}},
           "condition \"splendid\" not met"},
          {{{"wonderful", true}, {"splendid", true}, {"top of the world", false}},
           "discharge macaroon \"bob-is-great\" was not used"},
        },
      },
      {
        "one discharge used for two macaroons",
        {
          {"root-key", "root-id", {
              {"somewhere else", "bob", "bob-caveat-root-key"},
              {"bob-is-great", "charlie", "bob-caveat-root-key"}}, ""},
          {"bob-caveat-root-key", "somewhere else", {
              {"bob-is-great", "charlie", "bob-caveat-root-key"}}, "bob"},
          {"bob-caveat-root-key", "bob-is-great", {}, "bob"},
        },
        {
          {{}, "discharge macaroon \"bob-is-great\" was used more than once"},
        },
      },
      {
        "recursive third party caveat",
        {
          {"root-key", "root-id", {
              {"bob-is-great", "bob", "bob-caveat-root-key"}}, ""},
          {"bob-caveat-root-key", "bob-is-great", {
              {"bob-is-great", "charlie", "bob-caveat-root-key"}}, "bob"},
        },
        {
          {{}, "discharge macaroon \"bob-is-great\" was used more than once"},
        },
      },
      {
        "two third party caveats",
        {
          {"root-key", "root-id", {
              {"wonderful", "", ""},
              {"bob-is-great", "bob", "bob-caveat-root-key"},
              {"charlie-is-great", "charlie", "charlie-caveat-root-key"}}, ""},
          {"bob-caveat-root-key", "bob-is-great", {
              {"splendid", "", ""}}, "bob"},
          {"charlie-caveat-root-key", "charlie-is-great", {
              {"top of the world", "", ""}}, "charlie"},
        },
        {
          {{{"wonderful", true}, {"splendid", true}, {"top of the world", true}}, ""},
          {{{"wonderful", true}, {"splendid", false}, {"top of the world", true}},
           "condition \"splendid\" not met"},
          {{{"wonderful", true}, {"splendid", true}, {"top of the world", false}},
           "condition \"top of the world\" not met"},
        },
      },
      {
        "third party caveat with undischarged third party caveat",
        {
          {"root-key", "root-id", {
              {"wonderful", "", ""},
              {"bob-is-great", "bob", "bob-caveat-root-key"}}, ""},
          {"bob-caveat-root-key", "bob-is-great", {
              {"splendid", "", ""},
              {"barbara-is-great", "barbara", "barbara-caveat-root-key"}}, "bob"},
        },
        {
          {{{"wonderful", true}, {"splendid", true}},
           "cannot find discharge macaroon for caveat \"barbara-is-great\""},
        },
      },
      {
        "recursive third party caveats",
        RECURSIVE_THIRD_PARTY_CAVEAT_MACAROONS,
        {
          {{{"wonderful", true}, {"splendid", true}, {"high-fiving", true}, {"spiffing", true}}, ""},
          {{{"wonderful", true}, {"splendid", true}, {"high-fiving", false}, {"spiffing", true}},
           "condition \"high-fiving\" not met"},
        },
      },
      {
        "unused discharge",
        {
          {"root-key", "root-id", {}, ""},
          {"other-key", "unused", {}, ""},
        },
        {
          {{}, "discharge macaroon \"unused\" was not used"},
        },
      },
    };

    TEST_CASE("verify", "[verifier]")
    {
      for (const VerifyTest& test : VERIFY_TESTS) {
        INFO("test: " << test.about);

        Slice macaroons = makeMacaroons(test.macaroons);
        Buffer rootKey = makeBuffer(test.macaroons[0].rootKey);
        const Macaroon& primary = macaroons[0];
        Slice discharges(macaroons.begin() + 1, macaroons.end());

        for (const ConditionTest& cond : test.conditions) {
          ConditionChecker check = [&cond] (const std::string& caveat) {
            auto it = cond.conditions.find(caveat);
            if (it == cond.conditions.end() || !it->second)
              throw ConditionNotMet("condition \"" + caveat + "\" not met");
          };

          std::string err = verifyError(primary, rootKey, check, discharges);
          CHECK(err == cond.expectErr);

          // A clone verifies the same way.
          CHECK(verifyError(primary.clone(), rootKey, check, discharges) == err);
        }
      }
    }

    TEST_CASE("verify without caveats never calls the checker", "[verifier]")
    {
      Buffer rootKey = makeBuffer("secret");
      Macaroon m(rootKey, "some id", "a location");

      int calls = 0;
      ConditionChecker never = [&calls] (const std::string&) {
        ++calls;
        throw ConditionNotMet("condition is never true");
      };
      CHECK_NOTHROW(m.verify(rootKey, never, Slice()));
      CHECK(calls == 0);
    }

    TEST_CASE("first party caveats are each checked once", "[verifier]")
    {
      Buffer rootKey = makeBuffer("secret");
      Macaroon m(rootKey, "some id", "a location");
      m.addFirstPartyCaveat("a caveat");
      m.addFirstPartyCaveat("another caveat");

      std::map<std::string, int> tested;
      std::set<std::string> accepted = {"a caveat", "another caveat"};
      ConditionChecker check = [&] (const std::string& caveat) {
        ++tested[caveat];
        if (accepted.count(caveat) == 0)
          throw ConditionNotMet("condition not met");
      };

      CHECK_NOTHROW(m.verify(rootKey, check, Slice()));
      CHECK(tested.size() == 2);
      CHECK(tested["a caveat"] == 1);
      CHECK(tested["another caveat"] == 1);

      m.addFirstPartyCaveat("not met");
      // The checker's own exception reaches the caller.
      CHECK_THROWS_AS(m.verify(rootKey, check, Slice()), ConditionNotMet);
      CHECK(tested["not met"] == 1);
    }

    TEST_CASE("verify detects a wrong root key or signature", "[verifier]")
    {
      Buffer rootKey = makeBuffer("secret");
      Macaroon m(rootKey, "some id", "a location");
      m.addFirstPartyCaveat("a caveat");

      Verifier verifier;
      verifier.satisfyExact("a caveat");
      CHECK_NOTHROW(m.verify(rootKey, verifier, Slice()));

      CHECK_THROWS_AS(m.verify(makeBuffer("wrong"), verifier, Slice()), VerificationError);
      CHECK_THROWS_WITH(m.verify(makeBuffer("wrong"), verifier, Slice()),
                        "signature mismatch after caveat verification");

      Buffer signature = m.getSignature();
      signature[0] ^= 0x01;
      Macaroon tampered = Macaroon::fromFields(m.getLocation(), m.getIdentifier(),
                                               m.getRawCaveats(), signature);
      CHECK_THROWS_WITH(tampered.verify(rootKey, verifier, Slice()),
                        "signature mismatch after caveat verification");
    }

    TEST_CASE("verify rejects an unbound discharge", "[verifier]")
    {
      Buffer rootKey = makeBuffer("secret");
      Macaroon m(rootKey, "some id", "a location");
      m.addThirdPartyCaveat(makeBuffer("shared root key"), "3rd party caveat", "remote.com");

      Macaroon discharge(makeBuffer("shared root key"), "3rd party caveat", "remote location");
      Verifier verifier;
      CHECK_THROWS_WITH(m.verify(rootKey, verifier, Slice{discharge}),
                        "signature mismatch after caveat verification");
      CHECK_NOTHROW(m.verify(rootKey, verifier, Slice{m.prepareForRequest(discharge)}));
    }

    TEST_CASE("verify reports an undecryptable verification id", "[verifier]")
    {
      Buffer rootKey = makeBuffer("secret");
      Macaroon m(rootKey, "some id", "a location");
      m.addThirdPartyCaveat(makeBuffer("shared root key"), "bob-is-great", "bob");

      // Flip the last byte of the verification id payload.
      Buffer raw = m.getRawCaveats();
      size_t caveatSize = getPacketSize(std::string("bob-is-great").size());
      size_t vidSize = getPacketSize(m.getCaveats()[0].verificationId.size());
      raw[caveatSize + vidSize - 1] ^= 0x01;

      Macaroon tampered = Macaroon::fromFields(m.getLocation(), m.getIdentifier(), raw,
                                               m.getSignature());
      Macaroon discharge(makeBuffer("shared root key"), "bob-is-great", "bob");
      Slice discharges{tampered.prepareForRequest(discharge)};

      Verifier verifier;
      CHECK_THROWS_AS(tampered.verify(rootKey, verifier, discharges), VerificationError);
      CHECK_THROWS_WITH(tampered.verify(rootKey, verifier, discharges),
                        "cannot decrypt third party caveat \"bob-is-great\": decryption failed");
    }

    TEST_CASE("Verifier", "[verifier]")
    {
      Verifier verifier;

      SECTION("rejects everything when empty")
      {
        CHECK_FALSE(verifier.isSatisfied("account = 3735928559"));
        CHECK_THROWS_AS(verifier("account = 3735928559"), Verifier::Error);
        CHECK_THROWS_WITH(verifier("account = 3735928559"),
                          "condition \"account = 3735928559\" not met");
      }

      SECTION("exact conditions")
      {
        verifier.satisfyExact("account = 3735928559");
        CHECK(verifier.isSatisfied("account = 3735928559"));
        CHECK_FALSE(verifier.isSatisfied("account = 3735928558"));
        CHECK_NOTHROW(verifier("account = 3735928559"));
      }

      SECTION("general conditions")
      {
        verifier.satisfyGeneral([] (const std::string& caveat) {
            return caveat.compare(0, 6, "email ") == 0;
          });
        CHECK(verifier.isSatisfied("email alice@example.com"));
        CHECK_FALSE(verifier.isSatisfied("account = 3735928559"));

        CHECK_THROWS_AS(verifier.satisfyGeneral(Verifier::GeneralCheck()), Verifier::Error);
      }
    }

    TEST_CASE("checkTime", "[verifier]")
    {
      const std::string format = "%Y-%m-%d %H:%M:%S";
      Verifier::GeneralCheck check = checkTime(ndn::time::fromString("2020-06-01 12:00:00", format));

      CHECK(check("time < 2020-06-01 12:00:01"));
      CHECK(check("time < 2030-01-01 00:00:00"));
      CHECK_FALSE(check("time < 2020-06-01 12:00:00"));
      CHECK_FALSE(check("time < 2019-01-01 00:00:00"));
      CHECK_FALSE(check("time > 2030-01-01 00:00:00"));
      CHECK_FALSE(check("expires 2030-01-01 00:00:00"));

      CHECK(checkTime()("time < 2999-01-01 00:00:00"));
      CHECK_FALSE(checkTime()("time < 2000-01-01 00:00:00"));
    }

    TEST_CASE("Verifier configuration", "[verifier]")
    {
      Verifier verifier;

      SECTION("exact and time conditions")
      {
        std::istringstream input("verifier\n"
                                 "{\n"
                                 "  exact \"account = 3735928559\"\n"
                                 "  exact \"op = read\"\n"
                                 "  time-before \"2030-01-01 00:00:00\"\n"
                                 "}\n");
        verifier.load(input, "test.conf");

        CHECK(verifier.isSatisfied("account = 3735928559"));
        CHECK(verifier.isSatisfied("op = read"));
        CHECK_FALSE(verifier.isSatisfied("op = write"));
        CHECK(verifier.isSatisfied("time < 2031-01-01 00:00:00"));
        CHECK_FALSE(verifier.isSatisfied("time < 2029-01-01 00:00:00"));
      }

      SECTION("time before now")
      {
        std::istringstream input("verifier\n"
                                 "{\n"
                                 "  time-before now\n"
                                 "}\n");
        verifier.load(input, "test.conf");

        CHECK(verifier.isSatisfied("time < 2999-01-01 00:00:00"));
        CHECK_FALSE(verifier.isSatisfied("time < 2000-01-01 00:00:00"));
      }

      SECTION("missing section")
      {
        std::istringstream input("other\n"
                                 "{\n"
                                 "}\n");
        CHECK_THROWS_WITH(verifier.load(input, "test.conf"),
                          "Missing \"verifier\" section in test.conf");
      }

      SECTION("unknown option")
      {
        std::istringstream input("verifier\n"
                                 "{\n"
                                 "  fuzzy \"account\"\n"
                                 "}\n");
        CHECK_THROWS_WITH(verifier.load(input, "test.conf"),
                          "Unrecognized option \"fuzzy\" in test.conf");
      }

      SECTION("bad time")
      {
        std::istringstream input("verifier\n"
                                 "{\n"
                                 "  time-before \"2030-01-01\"\n"
                                 "}\n");
        CHECK_THROWS_AS(verifier.load(input, "test.conf"), Verifier::Error);
      }

      SECTION("syntax error")
      {
        std::istringstream input("verifier\n"
                                 "{\n"
                                 "  exact \"account\"\n");
        CHECK_THROWS_AS(verifier.load(input, "test.conf"), Verifier::Error);
      }

      SECTION("missing file")
      {
        CHECK_THROWS_WITH(verifier.load("/nonexistent/verifier.conf"),
                          "Failed to read configuration file: /nonexistent/verifier.conf");
      }
    }

  } // namespace tests
} // namespace macaroon
