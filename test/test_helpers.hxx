#if !defined(PGTX_H_TEST_HELPERS)
#  define PGTX_H_TEST_HELPERS

#  include <cstddef>
#  include <optional>
#  include <stdexcept>
#  include <string>
#  include <string_view>
#  include <type_traits>
#  include <vector>

#  include <pgtx/result.hxx>
#  include <pgtx/types.hxx>

namespace pgtx
{
namespace test
{
class test_failure : public std::logic_error
{
public:
  test_failure(std::string const &desc, char const file[], int line);

  ~test_failure() noexcept override;

  char const *file() const noexcept { return m_file; }
  int line() const noexcept { return m_line; }

private:
  char const *m_file;
  int m_line;
};


using testfunc = void (*)();


void register_test(char const name[], testfunc func);


/// Register a test while not inside a function.
struct registrar
{
  registrar(char const name[], testfunc func)
  {
    pgtx::test::register_test(name, func);
  }
};


// Register a test function, so the runner will run it.
#define PGTX_REGISTER_TEST(func)                                              \
  pgtx::test::registrar tst_##func                                            \
  {                                                                           \
    #func, func                                                               \
  }


/// Represent a value as a string, for failure messages.
std::string describe(std::string_view value);
std::string describe(std::optional<std::string> const &value);
std::string describe(result const &value);

inline std::string describe(char const value[])
{
  return describe(std::string_view{value});
}

inline std::string describe(std::string const &value)
{
  return describe(std::string_view{value});
}

inline std::string describe(bool value) { return value ? "true" : "false"; }

template<typename T>
inline std::enable_if_t<std::is_arithmetic_v<T>, std::string> describe(T value)
{
  return std::to_string(value);
}

template<typename T> inline std::string describe(std::vector<T> const &values)
{
  std::string out{"{"};
  for (std::size_t i{0}; i < std::size(values); ++i)
  {
    if (i > 0)
      out += ", ";
    out += describe(values[i]);
  }
  return out + "}";
}

inline std::string describe(transaction_status value)
{
  return std::string{to_string(value)};
}

inline std::string describe(strategy value)
{
  return std::string{to_string(value)};
}

inline std::string describe(command_kind value)
{
  return std::string{to_string(value)};
}


// Unconditional test failure.
[[noreturn]] void check_notreached(
  std::string const &desc, char const file[], int line);

#define PGTX_CHECK_NOTREACHED(desc)                                           \
  pgtx::test::check_notreached((desc), __FILE__, __LINE__)

// Verify that a condition is met, similar to assert()
#define PGTX_CHECK(condition, desc)                                           \
  pgtx::test::check((condition), #condition, (desc), __FILE__, __LINE__)
void check(
  bool condition, char const text[], std::string const &desc,
  char const file[], int line);

// Verify that variable has the expected value.
#define PGTX_CHECK_EQUAL(actual, expected, desc)                              \
  pgtx::test::check_equal(                                                    \
    (actual), #actual, (expected), #expected, (desc), __FILE__, __LINE__)
template<typename ACTUAL, typename EXPECTED>
inline void check_equal(
  ACTUAL const &actual, char const actual_text[], EXPECTED const &expected,
  char const expected_text[], std::string const &desc, char const file[],
  int line)
{
  if (expected == actual)
    return;
  std::string const fulldesc = desc + " (" + actual_text + " <> " +
                               expected_text +
                               ": "
                               "actual=" +
                               describe(actual) +
                               ", "
                               "expected=" +
                               describe(expected) + ")";
  throw test_failure{fulldesc, file, line};
}

// Verify that two values are not equal.
#define PGTX_CHECK_NOT_EQUAL(value1, value2, desc)                            \
  pgtx::test::check_not_equal(                                                \
    (value1), #value1, (value2), #value2, (desc), __FILE__, __LINE__)
template<typename VALUE1, typename VALUE2>
inline void check_not_equal(
  VALUE1 const &value1, char const text1[], VALUE2 const &value2,
  char const text2[], std::string const &desc, char const file[], int line)
{
  if (value1 != value2)
    return;
  std::string const fulldesc = desc + " (" + text1 + " == " + text2 +
                               ": "
                               "both are " +
                               describe(value2) + ")";
  throw test_failure{fulldesc, file, line};
}


struct failure_to_fail
{};


namespace internal
{
/// Syntactic placeholder: require (and accept) semicolon after block.
inline void end_of_statement() {}
} // namespace internal


// Verify that "action" does not throw an exception.
#define PGTX_CHECK_SUCCEEDS(action, desc)                                     \
  {                                                                           \
    try                                                                       \
    {                                                                         \
      action;                                                                 \
    }                                                                         \
    catch (std::exception const &e)                                           \
    {                                                                         \
      pgtx::test::check_notreached(                                           \
        std::string{desc} + " - \"" +                                         \
          #action "\" threw exception: " + e.what(),                          \
        __FILE__, __LINE__);                                                  \
    }                                                                         \
    catch (...)                                                               \
    {                                                                         \
      pgtx::test::check_notreached(                                           \
        std::string{desc} + " - \"" + #action "\" threw a non-exception!",    \
        __FILE__, __LINE__);                                                  \
    }                                                                         \
  }                                                                           \
  pgtx::test::internal::end_of_statement()

// Verify that "action" throws "exception_type".
#define PGTX_CHECK_THROWS(action, exception_type, desc)                       \
  {                                                                           \
    try                                                                       \
    {                                                                         \
      action;                                                                 \
      throw pgtx::test::failure_to_fail();                                    \
    }                                                                         \
    catch (pgtx::test::failure_to_fail const &)                               \
    {                                                                         \
      pgtx::test::check_notreached(                                           \
        std::string{desc} + " (\"" #action                                    \
                            "\" did not throw " #exception_type ")",          \
        __FILE__, __LINE__);                                                  \
    }                                                                         \
    catch (exception_type const &)                                            \
    {}                                                                        \
    catch (std::exception const &e)                                           \
    {                                                                         \
      pgtx::test::check_notreached(                                           \
        std::string{desc} +                                                   \
          " (\"" #action                                                      \
          "\" "                                                               \
          "threw exception other than " #exception_type ": " +                \
          e.what() + ")",                                                     \
        __FILE__, __LINE__);                                                  \
    }                                                                         \
    catch (...)                                                               \
    {                                                                         \
      pgtx::test::check_notreached(                                           \
        std::string{desc} + " (\"" #action "\" threw non-exception type)",    \
        __FILE__, __LINE__);                                                  \
    }                                                                         \
  }                                                                           \
  pgtx::test::internal::end_of_statement()


// Report expected exception
void expected_exception(std::string const &);
} // namespace test
} // namespace pgtx
#endif
