#include "SockBuffer.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <string>

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  constexpr char in_tmplt[]{"/tmp/SockBuffer-in-XXXXXX"};
  char infile[sizeof(in_tmplt)];
  strcpy(infile, in_tmplt);

  int fd_in;
  PCHECK((fd_in = mkstemp(infile)) != -1);
  {
    std::ofstream ofs(infile, std::ios::binary);
    ofs << "220 mx.example.com ESMTP\r\n"
        << "250-mx.example.com\r\n"
        << "250 8BITMIME\r\n"
        << "last line, no line ending";
  }

  constexpr char tmplt[]{"/tmp/SockBuffer-out-XXXXXX"};
  char outfile[sizeof(tmplt)];
  strcpy(outfile, tmplt);

  int fd_out;
  PCHECK((fd_out = mkstemp(outfile)) != -1);

  {
    boost::iostreams::stream<SockBuffer> iostream{
        SockBuffer(fd_in, fd_out,
                   Timeouts{std::chrono::seconds(10),
                            std::chrono::seconds(10)},
                   "")};

    std::string line;
    while (std::getline(iostream, line)) {
      if (iostream.eof()) {
        iostream.clear();
        iostream << line;
        break;
      }
      iostream << line << '\n';
    }
    iostream.clear();
    iostream << std::flush;
    CHECK(iostream.good());

    CHECK(!iostream->timed_out());
    CHECK_EQ(iostream->octets_read(), iostream->octets_written());
    iostream->log_stats();
  }

  std::string diff_cmd = "cmp ";
  diff_cmd += infile;
  diff_cmd += " ";
  diff_cmd += outfile;
  CHECK_EQ(system(diff_cmd.c_str()), 0);

  PCHECK(!close(fd_in));
  PCHECK(!close(fd_out));
  PCHECK(!unlink(infile)) << "unlink failed for " << infile;
  PCHECK(!unlink(outfile)) << "unlink failed for " << outfile;

  // A read that times out ends the stream and says so.
  int fds[2];
  PCHECK(pipe(fds) == 0);
  {
    boost::iostreams::stream<SockBuffer> iostream{
        SockBuffer(fds[0], fds[1],
                   Timeouts{std::chrono::milliseconds(10),
                            std::chrono::milliseconds(10)},
                   "id: 1, ")};
    std::string line;
    CHECK(!std::getline(iostream, line));
    CHECK(iostream->timed_out());
    CHECK_EQ(iostream->octets_read(), 0);
  }
  PCHECK(!close(fds[0]));
  PCHECK(!close(fds[1]));

  std::cout << "sizeof(SockBuffer) == " << sizeof(SockBuffer) << '\n'
            << std::flush;
}
