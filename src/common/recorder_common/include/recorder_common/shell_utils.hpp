#pragma once

#include <cstdio>
#include <string>
#include <sys/wait.h>

namespace recorder_common
{

/// 셸 명령 실행 결과를 담는 구조체
struct ShellResult
{
  bool ok = false;        ///< exit_code == 0 이면 true
  int exit_code = -1;     ///< 프로세스 종료 코드 (-1이면 popen 실패)
  std::string output;     ///< stdout 캡처 내용
};

/// 셸 명령을 popen으로 실행하고 결과를 ShellResult로 반환
/// 바이너리 출력도 잘리지 않도록 fread로 읽는다
inline ShellResult run_shell_command(const std::string & command)
{
  ShellResult out;

  FILE * pipe = popen(command.c_str(), "r");
  if (!pipe) {
    return out;
  }

  char buffer[65536];
  size_t n = 0;
  while ((n = fread(buffer, 1, sizeof(buffer), pipe)) > 0) {
    out.output.append(buffer, n);
  }

  const int status = pclose(pipe);
  if (status == -1) {
    out.exit_code = -1;
  } else if (WIFEXITED(status)) {
    out.exit_code = WEXITSTATUS(status);
  } else {
    out.exit_code = status;
  }
  out.ok = out.exit_code == 0;
  return out;
}

/// PATH 상에 실행 파일이 있는지 확인
inline bool command_exists(const std::string & name)
{
  const ShellResult r = run_shell_command("command -v " + name + " >/dev/null 2>&1");
  return r.ok;
}

}  // namespace recorder_common
