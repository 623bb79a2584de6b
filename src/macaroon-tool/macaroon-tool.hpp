#ifndef MACAROON_TOOL_MACAROON_TOOL_HPP
#define MACAROON_TOOL_MACAROON_TOOL_HPP

#include <Macaroon/macaroon.hpp>

#include <boost/noncopyable.hpp>
#include <boost/program_options/options_description.hpp>
#include <boost/program_options/positional_options.hpp>
#include <boost/program_options/variables_map.hpp>

#include <iosfwd>
#include <string>
#include <vector>


namespace macaroon {
  namespace tool {

    /**
     * Subcommands of macaroon-tool. Macaroons are read from files or from
     * the input stream ("-") and written to the output stream as JSON.
     */
    class MacaroonTool : boost::noncopyable
    {
    public:
      MacaroonTool(const std::string& programName,
                   std::istream& input, std::ostream& output, std::ostream& error);

      /**
       * Runs one command line (without the program name).
       * Returns 0 on success, 1 after printing "ERROR: ..." for a failed
       * command, 2 after printing the usage for an unknown command.
       */
      int
      main(const std::vector<std::string>& argv);

      int
      run(const std::string& command, const std::vector<std::string>& args);

      void
      usage(std::ostream& os) const;

    private:
      // Returns false if only the help text was requested.
      bool
      parse(const std::string& command, const std::vector<std::string>& args,
            boost::program_options::options_description& options,
            boost::program_options::variables_map& vm,
            const boost::program_options::positional_options_description& positional =
              boost::program_options::positional_options_description());

      int
      mint(const std::vector<std::string>& args);

      int
      addCaveat(const std::vector<std::string>& args);

      int
      inspect(const std::vector<std::string>& args);

      int
      bind(const std::vector<std::string>& args);

      int
      verify(const std::vector<std::string>& args);

      Macaroon
      readMacaroon(const std::string& filename);

    private:
      std::string m_programName;
      std::istream& m_input;
      std::ostream& m_output;
      std::ostream& m_error;
    };

  } // namespace tool
} // namespace macaroon

#endif // MACAROON_TOOL_MACAROON_TOOL_HPP
