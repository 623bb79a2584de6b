#include "macaroon-tool.hpp"

#include <Macaroon/macaroon-utils.hpp>
#include <Macaroon/verifier.hpp>

#include <boost/program_options/parsers.hpp>

#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>


namespace macaroon {
  namespace tool {

    namespace po = boost::program_options;

    namespace {

      Buffer
      decodeKey(const std::string& option, const std::string& hex)
      {
        try {
          return decode(hex);
        }
        catch (const JsonError& e) {
          throw std::invalid_argument("invalid --" + option + ": " + e.what());
        }
      }

    } // namespace

    MacaroonTool::MacaroonTool(const std::string& programName,
                               std::istream& input, std::ostream& output, std::ostream& error)
      : m_programName(programName)
      , m_input(input)
      , m_output(output)
      , m_error(error)
    {
    }

    int
    MacaroonTool::main(const std::vector<std::string>& argv)
    {
      if (argv.empty()) {
        usage(m_error);
        return 2;
      }

      std::vector<std::string> args(argv.begin() + 1, argv.end());
      try {
        return run(argv.front(), args);
      }
      catch (const std::exception& e) {
        m_error << "ERROR: " << e.what() << std::endl;
        return 1;
      }
    }

    int
    MacaroonTool::run(const std::string& command, const std::vector<std::string>& args)
    {
      if (command == "mint")
        return mint(args);
      if (command == "add-caveat")
        return addCaveat(args);
      if (command == "inspect")
        return inspect(args);
      if (command == "bind")
        return bind(args);
      if (command == "verify")
        return verify(args);

      usage(m_error);
      return 2;
    }

    void
    MacaroonTool::usage(std::ostream& os) const
    {
      os << "Usage: " << m_programName << " <command> [options]\n"
         << "\n"
         << "Commands:\n"
         << "  mint        create a macaroon (or a discharge macaroon)\n"
         << "  add-caveat  attenuate a macaroon with a first or third party caveat\n"
         << "  inspect     print the fields of a macaroon\n"
         << "  bind        bind a discharge macaroon to its primary macaroon\n"
         << "  verify      verify a macaroon and its discharges\n"
         << "\n"
         << "Macaroons are read and written as JSON; \"-\" stands for stdin.\n"
         << "Run '" << m_programName << " <command> --help' for the options of a command.\n";
    }

    bool
    MacaroonTool::parse(const std::string& command, const std::vector<std::string>& args,
                        po::options_description& options, po::variables_map& vm,
                        const po::positional_options_description& positional)
    {
      options.add_options()("help,h", "print this help text");
      po::store(po::command_line_parser(args).options(options).positional(positional).run(), vm);
      if (vm.count("help") > 0) {
        m_output << "Usage: " << m_programName << " " << command << " [options]\n"
                 << options;
        return false;
      }
      po::notify(vm);
      return true;
    }

    int
    MacaroonTool::mint(const std::vector<std::string>& args)
    {
      std::string key;
      std::string id;
      std::string location;
      std::vector<std::string> caveats;

      po::options_description options("mint options");
      options.add_options()
        ("key,k", po::value<std::string>(&key)->required(), "root key, hex encoded")
        ("id,i", po::value<std::string>(&id)->required(), "macaroon identifier")
        ("location,l", po::value<std::string>(&location), "location hint")
        ("caveat,c", po::value<std::vector<std::string>>(&caveats)->composing(),
         "first party caveat, may be repeated")
        ;

      po::variables_map vm;
      if (!parse("mint", args, options, vm))
        return 0;

      Macaroon m(decodeKey("key", key), id, location);
      for (const std::string& caveat : caveats)
        m.addFirstPartyCaveat(caveat);

      m_output << toJson(m) << std::endl;
      return 0;
    }

    int
    MacaroonTool::addCaveat(const std::vector<std::string>& args)
    {
      std::string input = "-";
      std::string caveat;
      std::string thirdPartyKey;
      std::string location;

      po::options_description options("add-caveat options");
      options.add_options()
        ("input", po::value<std::string>(&input), "macaroon to attenuate (default: stdin)")
        ("caveat,c", po::value<std::string>(&caveat)->required(),
         "condition, or third party caveat identifier")
        ("third-party-key", po::value<std::string>(&thirdPartyKey),
         "discharge root key, hex encoded; adds a third party caveat")
        ("location,l", po::value<std::string>(&location), "third party location")
        ;
      po::positional_options_description positional;
      positional.add("input", 1);

      po::variables_map vm;
      if (!parse("add-caveat", args, options, vm, positional))
        return 0;

      Macaroon m = readMacaroon(input);
      if (vm.count("third-party-key") > 0)
        m.addThirdPartyCaveat(decodeKey("third-party-key", thirdPartyKey), caveat, location);
      else
        m.addFirstPartyCaveat(caveat);

      m_output << toJson(m) << std::endl;
      return 0;
    }

    int
    MacaroonTool::inspect(const std::vector<std::string>& args)
    {
      std::string input = "-";

      po::options_description options("inspect options");
      options.add_options()
        ("input", po::value<std::string>(&input), "macaroon to inspect (default: stdin)")
        ;
      po::positional_options_description positional;
      positional.add("input", 1);

      po::variables_map vm;
      if (!parse("inspect", args, options, vm, positional))
        return 0;

      m_output << readMacaroon(input).inspect();
      return 0;
    }

    int
    MacaroonTool::bind(const std::vector<std::string>& args)
    {
      std::string input = "-";
      std::string root;

      po::options_description options("bind options");
      options.add_options()
        ("input", po::value<std::string>(&input), "discharge macaroon (default: stdin)")
        ("root,r", po::value<std::string>(&root)->required(), "primary macaroon")
        ;
      po::positional_options_description positional;
      positional.add("input", 1);

      po::variables_map vm;
      if (!parse("bind", args, options, vm, positional))
        return 0;

      Macaroon primary = readMacaroon(root);
      Macaroon discharge = readMacaroon(input);

      m_output << toJson(primary.prepareForRequest(discharge)) << std::endl;
      return 0;
    }

    int
    MacaroonTool::verify(const std::vector<std::string>& args)
    {
      std::string key;
      std::string config;
      std::vector<std::string> exact;
      std::vector<std::string> files;

      po::options_description options("verify options");
      options.add_options()
        ("key,k", po::value<std::string>(&key)->required(), "root key, hex encoded")
        ("config", po::value<std::string>(&config), "verifier configuration file")
        ("satisfy,s", po::value<std::vector<std::string>>(&exact)->composing(),
         "condition to accept, may be repeated")
        ("macaroons", po::value<std::vector<std::string>>(&files)->required(),
         "primary macaroon followed by its bound discharges")
        ;
      po::positional_options_description positional;
      positional.add("macaroons", -1);

      po::variables_map vm;
      if (!parse("verify", args, options, vm, positional))
        return 0;

      Buffer rootKey = decodeKey("key", key);

      Verifier verifier;
      if (!config.empty())
        verifier.load(config);
      for (const std::string& condition : exact)
        verifier.satisfyExact(condition);

      Slice slice;
      for (const std::string& file : files)
        slice.push_back(readMacaroon(file));

      Macaroon primary = slice.front();
      Slice discharges(slice.begin() + 1, slice.end());

      primary.verify(rootKey, verifier, discharges);

      m_output << "OK " << primary.getIdentifier() << std::endl;
      return 0;
    }

    Macaroon
    MacaroonTool::readMacaroon(const std::string& filename)
    {
      if (filename == "-")
        return fromJson(std::string(std::istreambuf_iterator<char>(m_input),
                                    std::istreambuf_iterator<char>()));

      std::ifstream is(filename.c_str());
      if (!is.is_open())
        throw std::runtime_error("Can not open file " + filename);

      return fromJson(std::string(std::istreambuf_iterator<char>(is),
                                  std::istreambuf_iterator<char>()));
    }

  } // namespace tool
} // namespace macaroon
