#include "gslgen/lipid_class.hpp"
#include <algorithm>

namespace gslgen {

namespace {

/// Named formula: a diagnostic ion or a neutral loss
struct NamedFormula {
    const char* name;
    const char* formula;
};

using NamedFormulas = std::vector<NamedFormula>;

enum class LcbRules : std::uint8_t {
    STANDARD,
    DEOXY
};

/// Fragmentation behavior of one class, expressed as data
struct RuleSet {
    LcbRules lcb_positive = LcbRules::STANDARD;

    /// Negative-mode long-chain base and fatty-acid fragments
    bool negative_backbone = false;

    /// Positive-mode diagnostic headgroup ions (neutral formulas)
    NamedFormulas positive_ions;

    /// Headgroup neutral losses from the precursor
    NamedFormulas losses;

    /// Apply `losses` in negative mode too (glycosidic cleavage keeps one water)
    bool negative_losses = false;

    /// Negative-mode losses that also form doubly charged products
    std::vector<std::string> doubly_charged;

    /// Negative-mode diagnostic headgroup ions (neutral formulas)
    NamedFormulas negative_ions;
};

struct ClassSeed {
    const char* name;
    ClassFamily family;
    const char* headgroup;
    int sialic_acids;
    int acidic_groups;
    std::vector<ChargeState> recommended;
    double mw_min;
    double mw_max;
    const char* description;
    RuleSet rules;
    ChargeState negative_charge_limit = 0;
};

// ============================================================================
// Rule builders
// ============================================================================

FragmentRule makeRule(const std::string& name, RuleBase base, const std::string& delta,
                      PolaritySet polarity, RuleScope scope = RuleScope::FRAGMENT,
                      ChargeState max_charge = 1) {
    FragmentRule rule;
    rule.name = name;
    rule.base = base;
    rule.delta = FormulaDelta::parse(delta);
    rule.polarity = polarity;
    rule.scope = scope;
    rule.max_charge = max_charge;
    return rule;
}

void addIntactRules(std::vector<FragmentRule>& rules) {
    rules.push_back(makeRule("precursor", RuleBase::PRECURSOR, "", PolaritySet::BOTH,
                             RuleScope::INTACT_PRECURSOR));
    rules.push_back(makeRule("precursor-(H2O,18)", RuleBase::PRECURSOR, "-H2O",
                             PolaritySet::POSITIVE, RuleScope::INTACT_PRECURSOR));
}

void addPositiveLcbRules(std::vector<FragmentRule>& rules, LcbRules kind) {
    if (kind == LcbRules::DEOXY) {
        rules.push_back(makeRule("doxLCB {lcb}", RuleBase::LONG_CHAIN_BASE, "",
                                 PolaritySet::POSITIVE));
        rules.push_back(makeRule("doxLCB {lcb}(-H2O)", RuleBase::LONG_CHAIN_BASE, "-H2O",
                                 PolaritySet::POSITIVE));
        return;
    }
    rules.push_back(makeRule("LCB {lcb}(-HO)", RuleBase::LONG_CHAIN_BASE, "-H2O",
                             PolaritySet::POSITIVE));
    rules.push_back(makeRule("LCB {lcb}(-H3O2)", RuleBase::LONG_CHAIN_BASE, "-H4O2",
                             PolaritySet::POSITIVE));
    rules.push_back(makeRule("LCB {lcb}(-CH3O2)", RuleBase::LONG_CHAIN_BASE, "-CH4O2",
                             PolaritySet::POSITIVE));
}

void addNegativeBackboneRules(std::vector<FragmentRule>& rules) {
    rules.push_back(makeRule("LCB(-CH3O)", RuleBase::LONG_CHAIN_BASE, "-CH2O",
                             PolaritySet::NEGATIVE));
    rules.push_back(makeRule("LCB(-C2H8NO)", RuleBase::LONG_CHAIN_BASE, "-C2H7NO",
                             PolaritySet::NEGATIVE));
    rules.push_back(makeRule("FA {fa}+(HN)", RuleBase::FATTY_ACID, "+HN-O",
                             PolaritySet::NEGATIVE));
    rules.push_back(makeRule("FA {fa}+(C2H3N)", RuleBase::FATTY_ACID, "+C2H3N-O",
                             PolaritySet::NEGATIVE));
    rules.push_back(makeRule("FA {fa}+(C2H3NO)", RuleBase::FATTY_ACID, "+C2H3N",
                             PolaritySet::NEGATIVE));
}

void addIons(std::vector<FragmentRule>& rules, const NamedFormulas& ions,
             PolaritySet polarity) {
    for (const auto& ion : ions) {
        rules.push_back(makeRule(ion.name, RuleBase::NONE, ion.formula, polarity));
    }
}

void addLosses(std::vector<FragmentRule>& rules, const RuleSet& set, Polarity polarity) {
    for (const auto& loss : set.losses) {
        FormulaDelta delta = FormulaDelta::removing(Formula::parse(loss.formula));
        PolaritySet target = PolaritySet::POSITIVE;
        ChargeState max_charge = 1;

        if (polarity == Polarity::NEGATIVE) {
            delta += FormulaDelta::parse("+H2O");
            target = PolaritySet::NEGATIVE;
            if (std::find(set.doubly_charged.begin(), set.doubly_charged.end(),
                          loss.name) != set.doubly_charged.end()) {
                max_charge = 2;
            }
        }

        FragmentRule rule;
        rule.name = loss.name;
        rule.base = RuleBase::PRECURSOR;
        rule.delta = delta;
        rule.polarity = target;
        rule.scope = RuleScope::FRAGMENT;
        rule.max_charge = max_charge;
        rules.push_back(std::move(rule));
    }
}

std::vector<FragmentRule> buildRules(const ClassSeed& seed) {
    const RuleSet& set = seed.rules;
    std::vector<FragmentRule> rules;

    addIntactRules(rules);
    addPositiveLcbRules(rules, set.lcb_positive);
    addLosses(rules, set, Polarity::POSITIVE);
    addIons(rules, set.positive_ions, PolaritySet::POSITIVE);
    addIons(rules, set.negative_ions, PolaritySet::NEGATIVE);
    if (set.negative_losses) {
        addLosses(rules, set, Polarity::NEGATIVE);
    }
    if (set.negative_backbone) {
        addNegativeBackboneRules(rules);
    }
    return rules;
}

NamedFormulas concat(std::initializer_list<NamedFormulas> parts) {
    NamedFormulas out;
    for (const auto& part : parts) {
        out.insert(out.end(), part.begin(), part.end());
    }
    return out;
}

// ============================================================================
// Diagnostic ion groups
// ============================================================================

const NamedFormulas HEX_IONS = {
    {"HG(Hex,162)", "C6H10O5"},
    {"HG(Hex,180)", "C6H12O6"},
};

const NamedFormulas HEX180_ION = {
    {"HG(Hex,180)", "C6H12O6"},
};

const NamedFormulas HEX2_IONS = {
    {"HG(Hex2,324)", "C12H20O10"},
    {"HG(Hex2,342)", "C12H22O11"},
};

const NamedFormulas HEXNAC_IONS = {
    {"HG(HexNAc,221)", "C8H15NO6"},
    {"HG(HexNAc,203)", "C8H13NO5"},
    {"HG(HexNAc,185)", "C8H11NO4"},
    {"HG(HexNAc,155)", "C7H9NO3"},
    {"HG(HexNAc,137)", "C7H7NO2"},
};

const NamedFormulas HEXNACHEX_IONS = {
    {"HG(HexNAcHex,383)", "C14H25NO11"},
    {"HG(HexNAcHex,365)", "C14H23NO10"},
};

const NamedFormulas SIALIC_IONS = {
    {"HG(NeuAc,309)", "C11H19NO9"},
    {"HG(NeuAc,291)", "C11H17NO8"},
};

const NamedFormulas DISIALIC_IONS = {
    {"HG(NeuAc2,600)", "C22H36N2O17"},
    {"HG(NeuAc2,582)", "C22H34N2O16"},
};

const NamedFormulas NEG_SIALIC_IONS = {
    {"HG(NeuAc,291)", "C11H17NO8"},
};

const NamedFormulas NEG_DISIALIC_IONS = {
    {"HG(NeuAc2,582)", "C22H34N2O16"},
    {"HG(NeuAc2-CO2,538)", "C21H34N2O14"},
};

const NamedFormulas NEG_TRISIALIC_IONS = {
    {"HG(NeuAc3,873)", "C33H51N3O24"},
    {"HG(NeuAc3-CO2,829)", "C32H51N3O22"},
};

const NamedFormulas NEG_NLC_IONS = {
    {"HG(Hex,180)", "C6H12O6"},
    {"HG(Hex,162)", "C6H10O5"},
    {"HG(HexNAc,221)", "C8H15NO6"},
    {"HG(HexNAc,203)", "C8H13NO5"},
    {"HG(HexNAcHex,383)", "C14H25NO11"},
    {"HG(HexNAcHex,365)", "C14H23NO10"},
};

// ============================================================================
// Headgroup neutral losses
// ============================================================================

const NamedFormulas HEX_LOSSES = {
    {"HG(-Hex,162)", "C6H10O5"},
    {"HG(-Hex,180)", "C6H12O6"},
    {"HG(-Hex,198)", "C6H14O7"},
};

const NamedFormulas LAC_LOSSES = {
    {"HG(-Hex2,342)", "C12H22O11"},
    {"HG(-Hex2,360)", "C12H24O12"},
    {"HG(-Hex2,324)", "C12H20O10"},
};

const NamedFormulas GB3_LOSSES = {
    {"HG(-Hex3,504)", "C18H32O16"},
    {"HG(-Hex3,522)", "C18H34O17"},
    {"HG(-Hex3,540)", "C18H36O18"},
    {"HG(-Hex2,342)", "C12H22O11"},
    {"HG(-Hex,180)", "C6H12O6"},
};

const NamedFormulas GB4_LOSSES = {
    {"HG(-HexNAc,221)", "C8H15NO6"},
    {"HG(-HexNAcHex,383)", "C14H25NO11"},
    {"HG(-HexNAcHex2,545)", "C20H35NO16"},
    {"HG(-HexNAcHex3,707)", "C26H45NO21"},
    {"HG(-HexNAcHex3,725)", "C26H47NO22"},
};

const NamedFormulas GA1_LOSSES = {
    {"HG(-HexNAc,221)", "C8H15NO6"},
    {"HG(-HexNAcHex,383)", "C14H25NO11"},
    {"HG(-HexNAc2Hex,586)", "C22H38N2O16"},
    {"HG(-HexNAc2Hex,604)", "C22H40N2O17"},
    {"HG(-HexNAc2Hex2,748)", "C28H48N2O21"},
    {"HG(-HexNAc2Hex2,766)", "C28H50N2O22"},
    {"HG(-HexNAc2Hex3,910)", "C34H58N2O26"},
    {"HG(-HexNAc2Hex3,928)", "C34H60N2O27"},
};

const NamedFormulas GA2_LOSSES = {
    {"HG(-HexNAc,221)", "C8H15NO6"},
    {"HG(-HexNAcHex,383)", "C14H25NO11"},
    {"HG(-HexNAcHex2,545)", "C20H35NO16"},
    {"HG(-HexNAcHex2,563)", "C20H37NO17"},
};

const NamedFormulas LC3_LOSSES = {
    {"HG(-HexNAc,221)", "C8H15NO6"},
    {"HG(-HexNAcHex,383)", "C14H25NO11"},
    {"HG(-HexNAcHex,401)", "C14H27NO12"},
    {"HG(-HexNAcHex2,545)", "C20H35NO16"},
    {"HG(-HexNAcHex2,563)", "C20H37NO17"},
};

const NamedFormulas LC4_LOSSES = {
    {"HG(-HexNAc,221)", "C8H15NO6"},
    {"HG(-HexNAc2,442)", "C16H28N2O11"},
    {"HG(-HexNAc2Hex,586)", "C22H38N2O16"},
    {"HG(-HexNAc2Hex,604)", "C22H40N2O17"},
    {"HG(-HexNAc2Hex2,748)", "C28H48N2O21"},
    {"HG(-HexNAc2Hex2,766)", "C28H50N2O22"},
    {"HG(-HexNAc2Hex2,784)", "C28H52N2O23"},
};

const NamedFormulas SM4_LOSSES = {
    {"HG(-SO4H2,98)", "H2O4S"},
    {"HG(-SHex,260)", "C6H12O9S"},
    {"HG(-SHex,278)", "C6H14O10S"},
    {"HG(-SHex,242)", "C6H10O8S"},
};

const NamedFormulas SHEX2_LOSSES = {
    {"HG(-SO3,80)", "O3S"},
    {"HG(-HSO3,81)", "HO3S"},
    {"HG(-H2SO4,98)", "H2O4S"},
    {"HG(-SHex,242)", "C6H10O8S"},
    {"HG(-SHex,260)", "C6H12O9S"},
    {"HG(-SHex,278)", "C6H14O10S"},
    {"HG(-SHexHex,404)", "C12H20O13S"},
    {"HG(-SHexHex,422)", "C12H22O14S"},
    {"HG(-SHexHex,440)", "C12H24O15S"},
};

const NamedFormulas GM4_LOSSES = {
    {"HG(-Neu5Ac,309)", "C11H19NO9"},
    {"HG(-HexNeu5Ac,471)", "C17H29NO14"},
};

const NamedFormulas GM3_LOSSES = {
    {"HG(-Neu5Ac,309)", "C11H19NO9"},
    {"HG(-HexNeu5Ac,471)", "C17H29NO14"},
    {"HG(-Hex2Neu5Ac,633)", "C23H39NO19"},
};

const NamedFormulas GM2_LOSSES = {
    {"HG(-Neu5Ac,309)", "C11H19NO9"},
    {"HG(-Neu5AcHexNAc,512)", "C19H32N2O14"},
    {"HG(-Neu5AcHexNAcHex,674)", "C25H42N2O19"},
    {"HG(-Neu5AcHexNAcHex2,836)", "C31H52N2O24"},
};

const NamedFormulas GM1_LOSSES = {
    {"HG(-Neu5Ac,309)", "C11H19NO9"},
    {"HG(-Neu5AcHexNAcHex,674)", "C25H42N2O19"},
    {"HG(-Neu5AcHexNAcHex2,836)", "C31H52N2O24"},
    {"HG(-Neu5AcHexNAcHex3,998)", "C37H62N2O29"},
    {"HG(-Neu5AcHexNAcHex3,1016)", "C37H64N2O30"},
};

const NamedFormulas GD3_LOSSES = {
    {"HG(-Neu5Ac,309)", "C11H19NO9"},
    {"HG(-Neu5Ac2,600)", "C22H36N2O17"},
    {"HG(-HexNeu5Ac2,780)", "C28H46N2O22"},
    {"HG(-Hex2Neu5Ac2,942)", "C34H56N2O27"},
};

const NamedFormulas GD2_LOSSES = {
    {"HG(-Neu5Ac,309)", "C11H19NO9"},
    {"HG(-Neu5Ac2,600)", "C22H36N2O17"},
    {"HG(-HexNAc,221)", "C8H15NO6"},
    {"HG(-HexNAc,203)", "C8H13NO5"},
    {"HG(-Neu5AcHexNAc,512)", "C19H32N2O14"},
    {"HG(-Neu5Ac2HexNAc,803)", "C30H49N3O22"},
    {"HG(-Neu5Ac2HexNAcHex,965)", "C36H59N3O27"},
    {"HG(-HexNAcHex2Neu5Ac2,1127)", "C42H69N3O32"},
};

const NamedFormulas GD1_LOSSES = {
    {"HG(-Neu5Ac,309)", "C11H19NO9"},
    {"HG(-Neu5Ac2,618)", "C22H38N2O18"},
    {"HG(-Neu5Ac2,600)", "C22H36N2O17"},
    {"HG(-Neu5Ac2Hex,762)", "C28H46N2O22"},
    {"HG(-Neu5Ac2HexNAcHex,965)", "C36H59N3O27"},
    {"HG(-Neu5Ac2HexNAcHex2,1127)", "C42H69N3O32"},
    {"HG(-Neu5Ac2HexNAcHex3,1289)", "C48H79N3O37"},
};

const NamedFormulas GT1A_LOSSES = {
    {"HG(-Neu5Ac,309)", "C11H19NO9"},
    {"HG(-Neu5Ac2,600)", "C22H36N2O17"},
    {"HG(-Neu5Ac2,618)", "C22H38N2O18"},
    {"HG(-Neu5Ac3,909)", "C33H55N3O26"},
    {"HG(-Neu5Ac3,891)", "C33H53N3O25"},
    {"HG(-Neu5Ac2HexNAcHex,965)", "C36H59N3O27"},
    {"HG(-Neu5Ac3HexNAcHex,1274)", "C47H78N4O36"},
    {"HG(-Neu5Ac3HexNAcHex,1256)", "C47H76N4O35"},
};

const NamedFormulas GT1B_LOSSES = {
    {"HG(-Neu5Ac,309)", "C11H19NO9"},
    {"HG(-Neu5Ac2,600)", "C22H36N2O17"},
    {"HG(-Neu5Ac2,618)", "C22H38N2O18"},
    {"HG(-Neu5Ac3,909)", "C33H55N3O26"},
    {"HG(-Neu5Ac3,891)", "C33H53N3O25"},
    {"HG(-Neu5AcHexNAcHex,674)", "C25H42N2O19"},
    {"HG(-Neu5Ac3HexNAcHex,1274)", "C47H78N4O36"},
    {"HG(-Neu5Ac3HexNAcHex,1256)", "C47H76N4O35"},
};

const NamedFormulas GT1C_LOSSES = {
    {"HG(-Neu5Ac,309)", "C11H19NO9"},
    {"HG(-Neu5Ac3,891)", "C33H53N3O25"},
    {"HG(-Hex,180)", "C6H12O6"},
    {"HG(-HexHexNAc,383)", "C14H25NO11"},
    {"HG(-HexNeu5Ac3,1071)", "C39H65N3O31"},
    {"HG(-Neu5Ac3HexNAcHex,1274)", "C47H78N4O36"},
};

const NamedFormulas GT2_LOSSES = {
    {"HG(-Neu5Ac,309)", "C11H19NO9"},
    {"HG(-Neu5Ac2,600)", "C22H36N2O17"},
    {"HG(-Neu5Ac3,891)", "C33H53N3O25"},
    {"HG(-HexNAc,221)", "C8H15NO6"},
    {"HG(-HexNAcNeu5Ac3,1094)", "C41H66N4O30"},
    {"HG(-Neu5Ac3HexNAc,1112)", "C41H68N4O31"},
};

const NamedFormulas GT3_LOSSES = {
    {"HG(-Neu5Ac,309)", "C11H19NO9"},
    {"HG(-Neu5Ac2,600)", "C22H36N2O17"},
    {"HG(-Neu5Ac3,891)", "C33H53N3O25"},
    {"HG(-Neu5Ac3,909)", "C33H55N3O26"},
    {"HG(-Neu5Ac3Hex,1053)", "C39H63N3O30"},
    {"HG(-Neu5Ac3Hex,1215)", "C45H73N3O35"},
};

const NamedFormulas GQ1_LOSSES = {
    {"HG(-Neu5Ac,309)", "C11H19NO9"},
    {"HG(-Neu5Ac2,600)", "C22H36N2O17"},
    {"HG(-Neu5Ac3,891)", "C33H53N3O25"},
    {"HG(-Neu5Ac4,1182)", "C44H70N4O33"},
    {"HG(-Neu5Ac4HexNAcHex,1547)", "C58H93N5O43"},
    {"HG(-Neu5Ac4HexNAcHex,1727)", "C64H105N5O49"},
    {"HG(-Neu5Ac4HexNAcHex,1709)", "C64H103N5O48"},
    {"HG(-Neu5Ac4HexNAcHex,1871)", "C70H113N5O53"},
    {"HG(-Neu5Ac4HexNAcHex,1887)", "C70H113N5O54"},
};

const NamedFormulas GP1_LOSSES = {
    {"HG(-Neu5Ac,309)", "C11H19NO9"},
    {"HG(-Neu5Ac2,600)", "C22H36N2O17"},
    {"HG(-Neu5Ac3,891)", "C33H53N3O25"},
    {"HG(-Neu5Ac4,1182)", "C44H70N4O33"},
    {"HG(-Neu5Ac4,1200)", "C44H72N4O34"},
    {"HG(-Neu5Ac5,1473)", "C55H87N5O41"},
    {"HG(-Neu5Ac5,1491)", "C55H89N5O42"},
    {"HG(-Neu5Ac4HexNAcHex,1547)", "C58H93N5O43"},
    {"HG(-Neu5Ac5HexNAcHex,1838)", "C69H110N6O51"},
};

const NamedFormulas NLC10_LOSSES = {
    {"HG(-HexNAc,221)", "C8H15NO6"},
    {"HG(-HexNAcHex,383)", "C14H25NO11"},
    {"HG(-HexNAc2Hex,586)", "C22H38N2O16"},
    {"HG(-HexNAc4Hex4,1478)", "C56H94N4O44"},
};

const NamedFormulas NLC8_LOSSES = {
    {"HG(-Hex,180)", "C6H12O6"},
    {"HG(-HexHexNAc,365)", "C14H23NO10"},
    {"HG(-HexHexNAc,383)", "C14H25NO11"},
    {"HG(-Hex3HexNAc3,1113)", "C42H71N3O31"},
    {"HG(-Hex3HexNAc3,1257)", "C42H71N3O32"},
};

const NamedFormulas NLC6_LOSSES = {
    {"HG(-Hex,180)", "C6H12O6"},
    {"HG(-HexHexNAc,365)", "C14H23NO10"},
    {"HG(-HexHexNAc,383)", "C14H25NO11"},
    {"HG(-Hex2HexNAc2,748)", "C28H48N2O21"},
    {"HG(-Hex2HexNAc2,766)", "C28H50N2O22"},
    {"HG(-Hex3HexNAc2,910)", "C34H58N2O26"},
    {"HG(-Hex3HexNAc2,928)", "C34H60N2O27"},
};

// ============================================================================
// Class seeds
// ============================================================================

RuleSet neutralGsl(NamedFormulas losses, NamedFormulas positive_ions) {
    RuleSet set;
    set.negative_backbone = true;
    set.losses = std::move(losses);
    set.positive_ions = std::move(positive_ions);
    return set;
}

RuleSet acidicGsl(NamedFormulas losses, NamedFormulas positive_ions,
                  NamedFormulas negative_ions,
                  std::vector<std::string> doubly_charged = {}) {
    RuleSet set = neutralGsl(std::move(losses), std::move(positive_ions));
    set.negative_losses = true;
    set.negative_ions = std::move(negative_ions);
    set.doubly_charged = std::move(doubly_charged);
    return set;
}

std::vector<ClassSeed> standardSeeds() {
    using F = ClassFamily;

    RuleSet ceramide;
    RuleSet deoxy_ceramide;
    deoxy_ceramide.lcb_positive = LcbRules::DEOXY;

    RuleSet sphingomyelin;
    sphingomyelin.negative_backbone = true;
    sphingomyelin.positive_ions = {
        {"Phosphocholine", "C5H14NO4P"},
        {"Phosphocholine-H2O", "C5H12NO3P"},
    };

    const NamedFormulas gm_positive = concat({SIALIC_IONS});
    const NamedFormulas gd_positive = concat({SIALIC_IONS, DISIALIC_IONS});
    const NamedFormulas gt_positive = concat({SIALIC_IONS, DISIALIC_IONS,
                                              {{"HG(HexNAcHex,365)", "C14H23NO10"}}});
    const NamedFormulas nlc_positive = concat({HEX180_ION, HEXNAC_IONS, HEXNACHEX_IONS});
    const std::vector<std::string> gt1_doubly = {"HG(-Neu5Ac,309)"};

    std::vector<ClassSeed> seeds = {
        {"Cer", F::CERAMIDE, "", 0, 0, {1}, 500, 750, "HO-", ceramide},
        {"doxCer", F::CERAMIDE, "", 0, 0, {1}, 480, 730,
         "headless, 1-deoxy-Ceramide", deoxy_ceramide},
        {"SM", F::SPHINGOMYELIN, "C5H12NO3P", 0, 1, {1}, 650, 900,
         "Phosphocholine-Cer (Sphingomyelin)", sphingomyelin},

        {"Hex", F::GLYCOSPHINGOLIPID, "C6H10O5", 0, 0, {1}, 600, 900,
         "β-D-Glc- or β-D-Gal-linked Ceramide (Hexosylceramide)",
         neutralGsl(HEX_LOSSES, HEX_IONS)},
        {"Lac", F::GLYCOSPHINGOLIPID, "C12H20O10", 0, 0, {1}, 700, 800,
         "Galβ1-4Glc-Cer (Lactosyl-Ceramide)",
         neutralGsl(LAC_LOSSES, concat({HEX_IONS, HEX2_IONS}))},
        {"LC3", F::GLYCOSPHINGOLIPID, "C20H33NO15", 0, 0, {1}, 900, 1000,
         "GlcNAcβ1-3Galβ1-4Glc-Cer (Lacto/neoLacto-series), isobaric to GA2",
         neutralGsl(LC3_LOSSES, concat({HEX_IONS, HEX2_IONS, HEXNAC_IONS}))},
        {"LC4", F::GLYCOSPHINGOLIPID, "C26H43NO20", 0, 0, {1}, 1100, 1200,
         "Galβ1-3GlcNAcβ1-3Galβ1-4Glc-Cer (Lacto-series)",
         neutralGsl(LC4_LOSSES, concat({HEX_IONS, HEX2_IONS, HEXNAC_IONS}))},
        {"Gb3", F::GLYCOSPHINGOLIPID, "C18H30O15", 0, 0, {1, 2}, 1000, 1100,
         "Galα1-4Galβ1-4Glc-Cer (Globotriaosylceramide)",
         neutralGsl(GB3_LOSSES, concat({HEX_IONS, {{"HG(Hex2,324)", "C12H20O10"},
                                                   {"HG(Hex3,487)", "C18H30O15"}}}))},
        {"Gb4", F::GLYCOSPHINGOLIPID, "C26H43NO20", 0, 0, {1, 2}, 1200, 1400,
         "GalNAcβ1-3Galα1-4Galβ1-4Glc-Cer (isobaric to GA1)",
         neutralGsl(GB4_LOSSES, concat({HEX_IONS, {{"HG(Hex2,324)", "C12H20O10"},
                                                   {"HG(Hex3,487)", "C18H30O15"}},
                                        HEXNAC_IONS,
                                        {{"HG(HexNAcHex,365)", "C14H23NO10"}}}))},
        {"GA2", F::GLYCOSPHINGOLIPID, "C20H33NO15", 0, 0, {1}, 1000, 1100,
         "GalNAcβ1-4Galβ1-4Glc-Cer (asialo-GM2), isobaric to Lc3",
         neutralGsl(GA2_LOSSES, concat({HEX180_ION, HEXNAC_IONS,
                                        {{"HG(HexHexNAc,383)", "C14H25NO11"}}}))},
        {"GA1", F::GLYCOSPHINGOLIPID, "C26H43NO20", 0, 0, {1}, 1200, 1400,
         "Galβ1-3GalNAcβ1-4Galβ1-4Glc-Cer (asialo-GM1)",
         neutralGsl(GA1_LOSSES, concat({HEX180_ION, HEXNAC_IONS,
                                        {{"HG(HexHexNAc,383)", "C14H25NO11"}}}))},

        {"SM4", F::GLYCOSPHINGOLIPID, "C6H10O8S", 0, 1, {1}, 700, 1100,
         "3-O-sulfated Gal-Cer (Sulfatide)",
         acidicGsl(SM4_LOSSES, HEX180_ION,
                   {{"HG(HSO4,97)", "H2O4S"},
                    {"HG(SHexCer,242)", "C6H10O8S"},
                    {"HG(SHexCer)+(C2H5NO)", "C8H15NO9S"}})},
        {"SHex2", F::GLYCOSPHINGOLIPID, "C12H20O13S", 0, 1, {1}, 700, 1100,
         "Sulfated dihexosylceramide",
         acidicGsl(SHEX2_LOSSES, concat({HEX180_ION, {{"HG(Hex2,342)", "C12H22O11"}}}),
                   {{"HG(HSO4,97)", "H2O4S"},
                    {"HG(SO3,80)", "HO3S"},
                    {"HG(SHex,260)", "C6H12O9S"},
                    {"HG(SHex,242)", "C6H10O8S"},
                    {"HG(SHexHex,404)", "C12H20O13S"},
                    {"HG(SHexHex,386)", "C12H18O12S"},
                    {"HG(Hex,180)", "C6H12O6"},
                    {"HG(Hex2,342)", "C12H22O11"}})},

        {"GM4", F::GLYCOSPHINGOLIPID, "C17H27NO13", 1, 0, {1, 2}, 1000, 1200,
         "Neu5Acα2-3Galβ-Cer",
         acidicGsl(GM4_LOSSES,
                   concat({gm_positive, {{"HG(NeuAcGal,471)", "C17H29NO14"},
                                         {"HG(NeuAcGal,453)", "C17H27NO13"}}}),
                   NEG_SIALIC_IONS)},
        {"GM3", F::GLYCOSPHINGOLIPID, "C23H37NO18", 1, 0, {1, 2}, 1200, 1300,
         "NeuAcα2-3Galβ1-4Glcβ-Cer",
         acidicGsl(GM3_LOSSES, concat({gm_positive, {{"HG(Hex2,342)", "C12H22O11"}}}),
                   NEG_SIALIC_IONS)},
        {"GM2", F::GLYCOSPHINGOLIPID, "C31H50N2O23", 1, 0, {1, 2}, 1400, 1500,
         "GalNAcβ1-4(NeuAcα2-3)Galβ1-4Glcβ-Cer",
         acidicGsl(GM2_LOSSES,
                   concat({gm_positive, HEXNAC_IONS, HEXNACHEX_IONS,
                           {{"HG(HexNAcHex2,545)", "C20H35NO16"},
                            {"HG(HexNAcHex2,527)", "C20H33NO15"}}}),
                   NEG_SIALIC_IONS)},
        {"GM1", F::GLYCOSPHINGOLIPID, "C37H60N2O28", 1, 0, {1, 2}, 1500, 1600,
         "Galβ1-3GalNAcβ1-4(NeuAcα2-3)Galβ1-4Glcβ-Cer",
         acidicGsl(GM1_LOSSES,
                   concat({gm_positive, HEXNAC_IONS, HEXNACHEX_IONS,
                           {{"HG(HexNAcHex2,545)", "C20H35NO16"},
                            {"HG(HexNAcHex2,527)", "C20H33NO15"}}}),
                   NEG_SIALIC_IONS)},

        {"GD3", F::GLYCOSPHINGOLIPID, "C34H54N2O26", 2, 0, {1, 2}, 1500, 1600,
         "NeuAcα2-8NeuAcα2-3Galβ1-4Glcβ-Cer",
         acidicGsl(GD3_LOSSES, gd_positive,
                   concat({NEG_SIALIC_IONS, NEG_DISIALIC_IONS}))},
        {"GD2", F::GLYCOSPHINGOLIPID, "C42H67N3O31", 2, 0, {2, 3}, 1700, 1800,
         "GalNAcβ1-4(NeuAcα2-8NeuAcα2-3)Galβ1-4Glcβ-Cer",
         acidicGsl(GD2_LOSSES,
                   concat({gd_positive, HEXNAC_IONS, HEXNACHEX_IONS,
                           {{"HG(NeuAc2Hex,744)", "C28H44N2O21"},
                            {"HG(Neu5Ac2HexNAcHex,947)", "C36H57N3O26"},
                            {"HG(Neu5Ac2HexNAcHex2,1109)", "C42H67N3O31"}}}),
                   concat({NEG_SIALIC_IONS, NEG_DISIALIC_IONS}))},
        {"GD1a", F::GLYCOSPHINGOLIPID, "C48H77N3O36", 2, 0, {2, 3}, 1800, 1900,
         "NeuAcα2-3Galβ1-3GalNAcβ1-4(NeuAcα2-3)Galβ1-4Glcβ-Cer",
         acidicGsl(GD1_LOSSES, gd_positive,
                   concat({NEG_SIALIC_IONS,
                           {{"HG(HexNAcHex,365)", "C14H23NO10"},
                            {"HG(NeuAcHexNAcHex,656)", "C25H40N2O18"}}}))},
        {"GD1b", F::GLYCOSPHINGOLIPID, "C48H77N3O36", 2, 0, {2, 3}, 1800, 1900,
         "Galβ1-3GalNAcβ1-4(NeuAcα2-8NeuAcα2-3)Galβ1-4Glcβ-Cer",
         acidicGsl(GD1_LOSSES, gd_positive,
                   concat({NEG_SIALIC_IONS, NEG_DISIALIC_IONS,
                           {{"HG(HexNAcHex,365)", "C14H23NO10"}}}))},

        {"GT3", F::GLYCOSPHINGOLIPID, "C45H71N3O34", 3, 0, {2, 3}, 1700, 1900,
         "Neu5Acα2-8Neu5Acα2-8Neu5Acα2-3Galβ1-4Glcβ-Cer",
         acidicGsl(GT3_LOSSES, concat({gt_positive, HEX180_ION}),
                   concat({NEG_SIALIC_IONS, NEG_DISIALIC_IONS, NEG_TRISIALIC_IONS}))},
        {"GT2", F::GLYCOSPHINGOLIPID, "C53H84N4O39", 3, 0, {2, 3}, 1900, 2100,
         "GalNAcβ1-4(Neu5Acα2-8Neu5Acα2-8Neu5Acα2-3)Galβ1-4Glcβ-Cer",
         acidicGsl(GT2_LOSSES, concat({gt_positive, HEXNAC_IONS}),
                   concat({NEG_SIALIC_IONS, NEG_DISIALIC_IONS, NEG_TRISIALIC_IONS,
                           {{"HG(HexNAc,203)", "C8H13NO5"}}}))},
        {"GT1a", F::GLYCOSPHINGOLIPID, "C59H94N4O44", 3, 0, {2, 3}, 2000, 2400,
         "Neu5Acα2-8Neu5Acα2-3Galβ1-3GalNAcβ1-4(Neu5Acα2-3)Galβ1-4Glcβ-Cer",
         acidicGsl(GT1A_LOSSES, gt_positive,
                   concat({NEG_SIALIC_IONS, NEG_DISIALIC_IONS}), gt1_doubly)},
        {"GT1b", F::GLYCOSPHINGOLIPID, "C59H94N4O44", 3, 0, {2, 3}, 2000, 2400,
         "Neu5Acα2-3Galβ1-3GalNAcβ1-4(Neu5Acα2-8Neu5Acα2-3)Galβ1-4Glcβ-Cer",
         acidicGsl(GT1B_LOSSES, gt_positive,
                   concat({NEG_SIALIC_IONS, NEG_DISIALIC_IONS,
                           {{"HG(NeuAcHexHexNAc,656)", "C25H40N2O18"}}}),
                   gt1_doubly)},
        {"GT1c", F::GLYCOSPHINGOLIPID, "C59H94N4O44", 3, 0, {1, 2}, 2000, 2400,
         "Galβ1-3GalNAcβ1-4(NeuAcα2-8NeuAcα2-8NeuAcα2-3)Galβ1-4Glcβ-Cer",
         acidicGsl(GT1C_LOSSES, gt_positive,
                   concat({NEG_SIALIC_IONS, NEG_DISIALIC_IONS,
                           {{"HG(HexHexNAc,365)", "C14H23NO10"}},
                           NEG_TRISIALIC_IONS}),
                   gt1_doubly)},
        {"GQ1", F::GLYCOSPHINGOLIPID, "C70H111N5O52", 4, 0, {3, 4}, 2300, 2400,
         "Neu5Acα2-8Neu5Acα2-8Neu5Acα2-3Galβ1-3GalNAcβ1-4(Neu5Acα2-3)Galβ1-4Glcβ-Cer",
         acidicGsl(GQ1_LOSSES, gt_positive,
                   concat({NEG_SIALIC_IONS, NEG_DISIALIC_IONS,
                           {{"HG(NeuAc2Hex,762)", "C28H46N2O22"}},
                           NEG_TRISIALIC_IONS}))},
        {"GP1", F::GLYCOSPHINGOLIPID, "C81H128N6O60", 5, 0, {3, 4, 5}, 2600, 2700,
         "Neu5Acα2-8Neu5Acα2-8Neu5Acα2-8Neu5Acα2-3Galβ1-3GalNAcβ1-4(Neu5Acα2-3)"
         "Galβ1-4Glcβ-Cer",
         acidicGsl(GP1_LOSSES,
                   concat({gt_positive, {{"HG(NeuAc4HexNAcHex,1529)", "C58H91N5O42"}}}),
                   concat({NEG_SIALIC_IONS, NEG_DISIALIC_IONS, NEG_TRISIALIC_IONS,
                           {{"HG(NeuAc4,1164)", "C44H68N4O32"},
                            {"HG(NeuAc4-CO2,1120)", "C43H68N4O30"}}}),
                   {"HG(-Neu5Ac,309)", "HG(-Neu5Ac2,600)"})},

        {"nLc10", F::GLYCOSPHINGOLIPID, "C68H112N4O50", 0, 0, {1, 2}, 2200, 2500,
         "GlcNAcβ1-3Galβ1-4GlcNAcβ1-3(Galα1-3Galβ1-4GlcNAcβ1-6)Galβ1-4GlcNAcβ1-3"
         "Galβ1-4Glcβ-Cer",
         acidicGsl(NLC10_LOSSES, nlc_positive, NEG_NLC_IONS,
                   {"HG(-HexNAc,221)", "HG(-HexNAcHex,383)", "HG(-HexNAc2Hex,586)"}),
         2},
        {"nLc8", F::GLYCOSPHINGOLIPID, "C54H89N3O40", 0, 0, {1, 2}, 1900, 2200,
         "Galβ1-4GlcNAcβ1-3(Galβ1-4GlcNAcβ1-6)Galβ1-4GlcNAcβ1-3Galβ1-4Glcβ-Cer",
         acidicGsl(NLC8_LOSSES, nlc_positive, NEG_NLC_IONS, {"HG(-Hex,180)"}), 2},
        {"nLc6", F::GLYCOSPHINGOLIPID, "C40H66N2O30", 0, 0, {1, 2}, 1500, 1800,
         "Galβ1-4GlcNAcβ1-3Galβ1-4GlcNAcβ1-3Galβ1-4Glcβ-Cer",
         acidicGsl(NLC6_LOSSES, nlc_positive, NEG_NLC_IONS), 2},
    };
    return seeds;
}

} // namespace

void registerStandardClasses(ClassRegistry& registry) {
    for (const auto& seed : standardSeeds()) {
        LipidClassDef def;
        def.name = seed.name;
        def.family = seed.family;
        def.headgroup = Formula::parse(seed.headgroup);
        def.sialic_acids = seed.sialic_acids;
        def.acidic_groups = seed.acidic_groups;
        def.recommended_charges = seed.recommended;
        def.charge_range = ChargeRange(
            1, *std::max_element(seed.recommended.begin(), seed.recommended.end()));
        def.negative_charge_limit = seed.negative_charge_limit;
        def.mw_range = Range<double>(seed.mw_min, seed.mw_max);
        def.description = seed.description;
        def.rules = buildRules(seed);

        if (def.name == std::string("doxCer")) {
            def.base_hydroxyls = 1;
            def.default_bases = {"18:0;1", "18:1;1"};
            def.default_label_token = "M3D";
        } else {
            def.default_bases = {"18:0;2", "18:1;2", "18:2;2"};
        }

        registry.add(std::move(def));
    }
}

} // namespace gslgen
