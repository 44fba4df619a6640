#include <dreamer/arguments_parser.hpp>
#include <dreamer/diagnostic.hpp>
#include <dreamer/runner.hpp>
#include <dreamer/config.hpp>

#include <cstdio>

int main(int argc, const char** argv)
{
  using namespace dreamer;

  arguments::parse(argc, argv, stdout);

  if(diagnostic.error_code() != 0)
    goto end;
  if(config.print_help)
    goto end;

  { // <- needed for goto
  runner run;
  run.go();
  }

end:
  diagnostic.print(stderr);
  return diagnostic.error_code();
}
