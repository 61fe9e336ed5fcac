#include <cstdlib>
#include <iostream>

#include <pgtx/pgtx>


int main(int argc, char *argv[])
{
  // Connection string, e.g. "dbname=test".  Transaction strategy and the list
  // of errors that should drop the connection come from the environment:
  // PGTX_TRANSACTIONS and PGTX_DISCONNECT_ON_ERROR_CODES.
  char const *const conninfo{(argc > 1) ? argv[1] : ""};

  try
  {
    pgtx::connection cx{conninfo, pgtx::connection_options::from_env()};

    auto const setup{pgtx::transaction(cx, [](pgtx::transaction_handle &tx) {
      tx.exec("CREATE TEMP TABLE pgtx_example (id integer UNIQUE)").no_rows();
      tx.exec("INSERT INTO pgtx_example VALUES (1)").no_rows();
    })};
    if (not setup)
    {
      std::cerr << "Setup rolled back: " << setup.reason() << '\n';
      return EXIT_FAILURE;
    }

    auto const out{pgtx::transaction(cx, [](pgtx::transaction_handle &tx) {
      // Ask for a savepoint around this statement, so that its failure does
      // not take the whole transaction down with it.
      try
      {
        tx.exec(
          "INSERT INTO pgtx_example VALUES ($1)", {1},
          pgtx::query_options{true});
      }
      catch (pgtx::unique_violation const &e)
      {
        std::cout << "Duplicate, as expected: " << e.what() << '\n';
      }

      tx.exec("INSERT INTO pgtx_example VALUES ($1)", {2}).no_rows();
      auto const count{
        tx.exec("SELECT count(*) FROM pgtx_example").one_field()};
      if (not count or *count != "2")
        tx.rollback("unexpected row count");
      return *count;
    })};

    if (out)
      std::cout << "Committed; " << out.value() << " rows.\n";
    else
      std::cout << "Rolled back: " << out.reason() << '\n';
  }
  catch (pgtx::connection_terminated const &e)
  {
    std::cerr << "Connection terminated: " << e.reason() << '\n';
    return EXIT_FAILURE;
  }
  catch (std::exception const &e)
  {
    std::cerr << e.what() << '\n';
    return EXIT_FAILURE;
  }
}
