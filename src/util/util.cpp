#include "util/util.hpp"

#include <iomanip>
#include <sstream>
#include <sys/stat.h>
#include <boost/version.hpp> // defines BOOST_VERSION as e.g. 107400 for 1.74.0

namespace TRAILCOV
{

  namespace UTIL
  {

    TimePoint get_current_time()
    {
      return std::chrono::steady_clock::now();
    };

    double get_duration(const TimePoint &t1, const TimePoint &t2)
    {
      return std::chrono::duration_cast<
                 std::chrono::milliseconds>(t2 - t1)
                 .count() /
             1000.;
    };

    bool file_exists(const std::string &filename)
    {
      struct stat buf;
      if (stat(filename.c_str(), &buf) != -1)
      {
        return true;
      }
      return false;
    }

    std::vector<std::string> split_string(const std::string &str)
    {
      char delim = ',';
      std::vector<std::string> result;
      std::stringstream ss(str);
      std::string intermediate;
      while (getline(ss, intermediate, delim))
      {
        result.push_back(intermediate);
      }
      return result;
    }

    bool check_file_extension(const std::string &filename,
                              const std::string &extension_list_str)
    {
      std::size_t dot = filename.find_last_of('.');
      if (dot == std::string::npos)
        return false;
      std::string fn_extension = filename.substr(dot + 1);
      for (const auto &extension : split_string(extension_list_str))
      {
        if (fn_extension == extension)
          return true;
      }
      return false;
    }

    std::string sha1_hexdigest(boost::uuids::detail::sha1 *sha1)
    {
      std::ostringstream oss;
      oss << std::hex << std::setfill('0');
#if BOOST_VERSION < 108600 // Boost < 1.86 uses unsigned int[5]
      unsigned int digest[5];
      sha1->get_digest(digest);
      for (int i = 0; i < 5; ++i)
      {
        oss << std::setw(8) << digest[i];
      }
#else // Boost >= 1.86 uses unsigned char[20]
      unsigned char digest[20];
      sha1->get_digest(digest);
      for (int i = 0; i < 20; ++i)
      {
        oss << std::setw(2) << static_cast<unsigned>(digest[i]);
      }
#endif
      return oss.str();
    }

  } // UTIL
} // TRAILCOV
