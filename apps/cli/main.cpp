#include <arpa/inet.h>
#include <iostream>
#include <string>
#include <sys/socket.h>
#include <unistd.h>
#include <vector>

namespace {

// Splits on whitespace; single or double quotes group a word, so JSON
// arguments can be typed as '{"score": 10}'.
std::vector<std::string> split_args(const std::string& line) {
  std::vector<std::string> out;
  std::string cur;
  char quote = 0;
  bool in_word = false;
  for (char c : line) {
    if (quote) {
      if (c == quote) quote = 0;
      else cur += c;
    } else if (c == '\'' || c == '"') {
      quote = c;
      in_word = true;
    } else if (c == ' ' || c == '\t') {
      if (in_word) out.push_back(cur);
      cur.clear();
      in_word = false;
    } else {
      cur += c;
      in_word = true;
    }
  }
  if (in_word) out.push_back(cur);
  return out;
}

std::string encode(const std::vector<std::string>& args) {
  std::string payload = "*" + std::to_string(args.size()) + "\r\n";
  for (const auto& a : args)
    payload += "$" + std::to_string(a.size()) + "\r\n" + a + "\r\n";
  return payload;
}

bool roundtrip(int fd, const std::vector<std::string>& args) {
  const auto payload = encode(args);
  if (send(fd, payload.data(), payload.size(), 0) < 0) return false;
  char buf[65536];
  auto n = recv(fd, buf, sizeof(buf), 0);
  if (n <= 0) return false;
  std::cout.write(buf, n);
  std::cout << std::endl;
  return true;
}

} // namespace

int main(int argc, char** argv) {
  std::string host = "127.0.0.1";
  int port = 6380;
  std::string token;
  for (int i = 1; i + 1 < argc; i += 2) {
    std::string a = argv[i];
    if (a == "--host") host = argv[i + 1];
    else if (a == "--port") port = std::stoi(argv[i + 1]);
    else if (a == "--token") token = argv[i + 1];
  }

  int fd = socket(AF_INET, SOCK_STREAM, 0);
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  inet_pton(AF_INET, host.c_str(), &addr.sin_addr);
  if (connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
    std::cerr << "connect failed\n";
    return 1;
  }
  if (!token.empty() && !roundtrip(fd, {"AUTH", token})) {
    close(fd);
    return 1;
  }
  std::string line;
  while (std::getline(std::cin, line)) {
    if (line == "quit") break;
    auto args = split_args(line);
    if (args.empty()) continue;
    if (!roundtrip(fd, args)) break;
  }
  close(fd);
  return 0;
}
