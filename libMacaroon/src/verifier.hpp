#ifndef MACAROON_VERIFIER_HPP
#define MACAROON_VERIFIER_HPP

#include "macaroon.hpp"

#include <ndn-cxx/util/time.hpp>

#include <boost/function.hpp>

#include <istream>
#include <set>
#include <string>
#include <vector>


namespace macaroon {

  class VerificationError : public std::runtime_error
  {
  public:
    explicit
    VerificationError(const std::string& what)
      : std::runtime_error(what)
    {
    }
  };

  /*
    Verifies primary against rootKey. Every first party caveat met on
    the way (including those of discharges) is passed to check; every
    third party caveat must be discharged by exactly one element of
    discharges, already bound to primary, and every discharge must be
    used.
  */
  void
  verify(const Macaroon& primary,
         const Buffer& rootKey,
         const ConditionChecker& check,
         const Slice& discharges);


  /*
    Verifier

    Condition checker built from exact conditions and general
    predicates. Rejects a condition by throwing Verifier::Error.
  */
  class Verifier
  {
  public:
    class Error : public std::runtime_error
    {
    public:
      explicit
      Error(const std::string& what)
	: std::runtime_error(what)
      {
      }
    };

    typedef boost::function<bool(const std::string& condition)> GeneralCheck;

    Verifier();

    void
    satisfyExact(const std::string& caveat);

    void
    satisfyGeneral(const GeneralCheck& check);

    // Loads a configuration of the form
    //
    //   verifier
    //   {
    //     exact "account = 3735928559"
    //     time-before now
    //     time-before "2030-01-01 00:00:00"
    //   }
    //
    // "time-before now" accepts "time < T" caveats while the clock is
    // earlier than T. "time-before <instant>" checks them against the given
    // instant (UTC, "YYYY-mm-dd HH:MM:SS") in place of the clock, so a
    // caveat is met when the instant is earlier than T.
    void
    load(const std::string& filename);

    void
    load(std::istream& input, const std::string& filename);

    bool
    isSatisfied(const std::string& condition) const;

    void
    operator()(const std::string& condition) const;

  private:
    std::set<std::string> m_exact;
    std::vector<GeneralCheck> m_general;
  };

  /*
    Returns a general check for "time < YYYY-mm-dd HH:MM:SS" caveats,
    met while now is earlier than the stated instant.
  */
  Verifier::GeneralCheck
  checkTime(const ndn::time::system_clock::time_point& now);

  // Same, reading the clock each time a caveat is checked.
  Verifier::GeneralCheck
  checkTime();

}// namespace macaroon

#endif // MACAROON_VERIFIER_HPP
