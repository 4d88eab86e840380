#include "list_error.hh"

std::string rc::to_string(list_error e)
{
    switch (e)
    {
    case list_error::empty_list:
        return "the list is empty, nothing was done";
    case list_error::index_out_of_bounds:
        return "index out of bounds";
    case list_error::not_found:
        return "the index could not be found, nothing was done";
    }

    // value outside the enumerators, e.g. from a bad cast
    return "<invalid rc::list_error>";
}
