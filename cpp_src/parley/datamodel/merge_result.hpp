#ifndef PARLEY_DATAMODEL_MERGE_RESULT_HPP
#define PARLEY_DATAMODEL_MERGE_RESULT_HPP

#include "parley/datamodel/message_version.hpp"

namespace parley {
namespace datamodel {

/// Outcome of folding an incoming version into stored state
struct merge_result
{
    merge_result(bool is_new, message_version winner)
     :  is_new(is_new),
        winner(std::move(winner))
    { }

    // true iff stored state now reflects the incoming version
    //  (or a conflict between it & stored state was resolved)
    bool is_new;

    // the version stored for the message id after the merge
    message_version winner;
};

}
}

#endif
