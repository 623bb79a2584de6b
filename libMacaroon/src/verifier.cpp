#include "verifier.hpp"
#include "crypto.hpp"

#include <ndn-cxx/util/logger.hpp>

#include <boost/property_tree/info_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include <fstream>

namespace macaroon {

  NDN_LOG_INIT(macaroon.Verifier);

  namespace {

    /*
      State of one verification: which discharges have been consumed,
      and the signature every discharge must be bound to.
    */
    class DischargeVerifier
    {
    public:
      DischargeVerifier(const Buffer& rootSignature,
                        const ConditionChecker& check,
                        const Slice& discharges)
        : m_rootSignature(rootSignature)
        , m_check(check)
        , m_discharges(discharges)
        , m_used(discharges.size(), false)
      {
      }

      void
      verifyNode(const Macaroon& m, const Buffer& key)
      {
        Buffer caveatSig = keyedHash(key, m.getIdentifier());

        for (const Caveat& caveat : m.getCaveats()) {
          if (!caveat.isThirdParty()) {
            m_check(caveat.id);
          }
          else {
            const Macaroon& discharge = useDischarge(caveat.id);

            Buffer dischargeKey;
            try {
              dischargeKey = decrypt(deriveCaveatKey(caveatSig), caveat.verificationId);
            }
            catch (const CryptoError& e) {
              throw VerificationError("cannot decrypt third party caveat \"" + caveat.id +
                                      "\": " + e.what());
            }

            NDN_LOG_TRACE("verifying discharge " << caveat.id);
            verifyNode(discharge, dischargeKey);
          }

          caveatSig = KeyedHasher(caveatSig)
            .update(caveat.verificationId)
            .update(caveat.id)
            .finalize();
        }

        Buffer boundSig = bindForRequest(m_rootSignature, caveatSig);
        if (!constantTimeEquals(boundSig, m.getSignature())) {
          NDN_LOG_DEBUG("signature mismatch for " << m.getIdentifier());
          throw VerificationError("signature mismatch after caveat verification");
        }
      }

      void
      checkAllUsed() const
      {
        for (size_t i = 0; i < m_discharges.size(); ++i) {
          if (!m_used[i])
            throw VerificationError("discharge macaroon \"" + m_discharges[i].getIdentifier() +
                                    "\" was not used");
        }
      }

    private:
      // The first discharge with the caveat's id is the only candidate,
      // even if a later one carries the same id.
      const Macaroon&
      useDischarge(const std::string& caveatId)
      {
        for (size_t i = 0; i < m_discharges.size(); ++i) {
          if (m_discharges[i].getIdentifier() != caveatId)
            continue;

          if (m_used[i])
            throw VerificationError("discharge macaroon \"" + caveatId +
                                    "\" was used more than once");
          m_used[i] = true;
          return m_discharges[i];
        }
        throw VerificationError("cannot find discharge macaroon for caveat \"" + caveatId + "\"");
      }

    private:
      const Buffer& m_rootSignature;
      const ConditionChecker& m_check;
      const Slice& m_discharges;
      std::vector<bool> m_used;
    };

    const std::string TIME_PREDICATE = "time < ";
    const std::string TIME_FORMAT = "%Y-%m-%d %H:%M:%S";

    // Returns false if text is not an instant in TIME_FORMAT.
    bool
    parseTime(const std::string& text, ndn::time::system_clock::time_point& instant)
    {
      try {
        instant = ndn::time::fromString(text, TIME_FORMAT);
        // Anything that does not print back the same way did not parse.
        return ndn::time::toString(instant, TIME_FORMAT) == text;
      }
      catch (const std::exception& e) {
        NDN_LOG_DEBUG("cannot parse time \"" << text << "\": " << e.what());
        return false;
      }
    }

    /*
      Function to check generic predicate
      check_time function retrieved from hyperdex-1.6.0: daemon/auth.cc
    */
    bool
    isBefore(const std::string& caveat, const ndn::time::system_clock::time_point& now)
    {
      if (caveat.compare(0, TIME_PREDICATE.size(), TIME_PREDICATE) != 0)
        return false;

      ndn::time::system_clock::time_point expiry;
      if (!parseTime(caveat.substr(TIME_PREDICATE.size()), expiry))
        return false;

      return now < expiry;
    }

  } // namespace


  void
  verify(const Macaroon& primary,
         const Buffer& rootKey,
         const ConditionChecker& check,
         const Slice& discharges)
  {
    DischargeVerifier verifier(primary.getSignature(), check, discharges);
    verifier.verifyNode(primary, rootKey);
    verifier.checkAllUsed();

    NDN_LOG_DEBUG("macaroon " << primary.getIdentifier() << " verified with "
                  << discharges.size() << " discharges");
  }


  /*
    Verifier
  */

  Verifier::Verifier()
  {
  }

  void
  Verifier::satisfyExact(const std::string& caveat)
  {
    m_exact.insert(caveat);
  }

  void
  Verifier::satisfyGeneral(const GeneralCheck& check)
  {
    if (!check)
      throw Error("Verifier::satisfyGeneral: empty check");
    m_general.push_back(check);
  }

  void
  Verifier::load(const std::string& filename)
  {
    std::ifstream input(filename.c_str());
    if (!input.is_open())
      throw Error("Failed to read configuration file: " + filename);

    load(input, filename);
  }

  void
  Verifier::load(std::istream& input, const std::string& filename)
  {
    boost::property_tree::ptree tree;
    try {
      boost::property_tree::read_info(input, tree);
    }
    catch (const boost::property_tree::info_parser_error& e) {
      throw Error("Failed to parse configuration file " + filename + ": " + e.message() +
                  " line " + std::to_string(e.line()));
    }

    boost::optional<boost::property_tree::ptree&> section = tree.get_child_optional("verifier");
    if (!section)
      throw Error("Missing \"verifier\" section in " + filename);

    for (const auto& option : *section) {
      const std::string& value = option.second.data();

      if (option.first == "exact") {
        satisfyExact(value);
      }
      else if (option.first == "time-before") {
        if (value == "now") {
          satisfyGeneral(checkTime());
        }
        else {
          ndn::time::system_clock::time_point instant;
          if (!parseTime(value, instant))
            throw Error("Invalid time-before \"" + value + "\" in " + filename);
          satisfyGeneral(checkTime(instant));
        }
      }
      else {
        throw Error("Unrecognized option \"" + option.first + "\" in " + filename);
      }
    }
  }

  bool
  Verifier::isSatisfied(const std::string& condition) const
  {
    if (m_exact.count(condition) > 0)
      return true;

    for (const GeneralCheck& check : m_general) {
      if (check(condition))
        return true;
    }
    return false;
  }

  void
  Verifier::operator()(const std::string& condition) const
  {
    if (!isSatisfied(condition))
      throw Error("condition \"" + condition + "\" not met");
  }


  Verifier::GeneralCheck
  checkTime(const ndn::time::system_clock::time_point& now)
  {
    return [now] (const std::string& caveat) {
      return isBefore(caveat, now);
    };
  }

  Verifier::GeneralCheck
  checkTime()
  {
    return [] (const std::string& caveat) {
      return isBefore(caveat, ndn::time::system_clock::now());
    };
  }

}// namespace macaroon
