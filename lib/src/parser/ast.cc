//
// Created by igor on 02/12/2025.
//

#include <zplc/ast.hh>

namespace zplc::ast {
    yes_no yes_no_from_char(char c) {
        return c == 'Y' ? yes_no::yes : yes_no::no;
    }

    justification justification_from_char(char c) {
        switch (c) {
            case 'C': return justification::center;
            case 'R': return justification::right;
            case 'J': return justification::justified;
            default: return justification::left;
        }
    }

    char to_char(yes_no value) {
        return value == yes_no::yes ? 'Y' : 'N';
    }

    char to_char(justification value) {
        switch (value) {
            case justification::center: return 'C';
            case justification::right: return 'R';
            case justification::justified: return 'J';
            case justification::left: break;
        }
        return 'L';
    }
}
